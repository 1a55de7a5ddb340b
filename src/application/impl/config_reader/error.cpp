#include "application/impl/config_reader/error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(qstore::application, ConfigReaderError, e) {
  using E = qstore::application::ConfigReaderError;
  switch (e) {
    case E::MISSING_ENTRY:
      return "node config lacks a required entry";
    case E::PARSER_ERROR:
      return "node config is unreadable or not valid JSON";
    case E::INVALID_VALUE:
      return "node config entry has an invalid value";
  }
  return "unknown ConfigReaderError";
}
