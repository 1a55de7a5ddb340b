#ifndef QSTORE_STORAGE_DATABASE_ERROR_HPP
#define QSTORE_STORAGE_DATABASE_ERROR_HPP

#include <ostream>

#include "outcome/outcome.hpp"

namespace qstore::storage {

  /**
   * @brief universal database interface error
   */
  enum class DatabaseError : int {
    OK = 0,
    NOT_FOUND = 1,
    CORRUPTION = 2,
    NOT_SUPPORTED = 3,
    INVALID_ARGUMENT = 4,
    IO_ERROR = 5,
    /// uniqueness constraint violated by an insert
    DUPLICATE_KEY = 6,
    /// concurrent transaction holds the row or serialization failed
    CONFLICT = 7,
    /// commit or rollback without an open transaction scope
    NO_TRANSACTION = 8,

    UNKNOWN = 1000
  };

  std::ostream &operator<<(std::ostream &out, const DatabaseError &error);

  /**
   * @return true for errors after which the caller may retry the whole
   * operation
   */
  bool isTransient(const std::error_code &ec);
}  // namespace qstore::storage

OUTCOME_HPP_DECLARE_ERROR_2(qstore::storage, DatabaseError);

#endif  // QSTORE_STORAGE_DATABASE_ERROR_HPP
