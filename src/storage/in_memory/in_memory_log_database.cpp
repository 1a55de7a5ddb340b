#include "storage/in_memory/in_memory_log_database.hpp"

#include "storage/in_memory/in_memory_log_transaction.hpp"

namespace qstore::storage {

  InMemoryLogDatabase::InMemoryLogDatabase()
      : rows_{std::make_shared<Rows>()} {}

  std::unique_ptr<LogTransaction> InMemoryLogDatabase::begin() {
    return std::make_unique<InMemoryLogTransaction>(rows_);
  }

  size_t InMemoryLogDatabase::size() const {
    std::lock_guard<std::mutex> lock(rows_->mutex);
    return rows_->committed.size();
  }

}  // namespace qstore::storage
