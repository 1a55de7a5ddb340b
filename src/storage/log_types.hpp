#ifndef QSTORE_STORAGE_LOG_TYPES_HPP
#define QSTORE_STORAGE_LOG_TYPES_HPP

/**
 * This file contains convenience typedefs for interfaces from face/, as they
 * are used with Buffer key and value types by every table of the log
 */

#include "base/buffer.hpp"
#include "storage/face/transactional_storage.hpp"

namespace qstore::storage {

  using Buffer = base::Buffer;

  using LogTransaction = face::Transaction<Buffer, Buffer>;

  using LogDatabase = face::TransactionalStorage<Buffer, Buffer>;

  using LogEntry = LogTransaction::Entry;

}  // namespace qstore::storage

#endif  // QSTORE_STORAGE_LOG_TYPES_HPP
