#ifndef QSTORE_APPLICATION_CONFIG_READER_ERROR_HPP
#define QSTORE_APPLICATION_CONFIG_READER_ERROR_HPP

#include "outcome/outcome.hpp"

namespace qstore::application {

  /**
   * Codes for errors that originate in configuration readers
   */
  enum class ConfigReaderError {
    MISSING_ENTRY = 1,
    PARSER_ERROR,
    INVALID_VALUE,
  };

}  // namespace qstore::application

OUTCOME_HPP_DECLARE_ERROR_2(qstore::application, ConfigReaderError);

#endif  // QSTORE_APPLICATION_CONFIG_READER_ERROR_HPP
