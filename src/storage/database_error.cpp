#include "storage/database_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(qstore::storage, DatabaseError, e) {
  using E = qstore::storage::DatabaseError;
  switch (e) {
    case E::OK:
      return "success";
    case E::NOT_SUPPORTED:
      return "operation is not supported";
    case E::CORRUPTION:
      return "data corruption";
    case E::INVALID_ARGUMENT:
      return "invalid argument";
    case E::IO_ERROR:
      return "IO error";
    case E::NOT_FOUND:
      return "not found";
    case E::DUPLICATE_KEY:
      return "duplicate key violates unique constraint";
    case E::CONFLICT:
      return "transaction conflict";
    case E::NO_TRANSACTION:
      return "no transaction in progress";
    case E::UNKNOWN:
      break;
  }

  return "unknown error";
}

namespace qstore::storage {

  std::ostream &operator<<(std::ostream &out, const DatabaseError &error) {
    return out << make_error_code(error).message();
  }

  bool isTransient(const std::error_code &ec) {
    return ec == DatabaseError::CONFLICT || ec == DatabaseError::IO_ERROR;
  }

}  // namespace qstore::storage
