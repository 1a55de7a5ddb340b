#ifndef QSTORE_STORAGE_IN_MEMORY_IN_MEMORY_LOG_DATABASE_HPP
#define QSTORE_STORAGE_IN_MEMORY_IN_MEMORY_LOG_DATABASE_HPP

#include <map>
#include <memory>
#include <mutex>

#include "storage/log_types.hpp"

namespace qstore::storage {

  /**
   * Log database kept in process memory. Transactions run at read committed
   * isolation: each one sees the committed state at the time of the read plus
   * its own writes.
   * Mostly needed in tests and for nodes running without persistence
   */
  class InMemoryLogDatabase : public LogDatabase {
   public:
    /// Committed rows, keyed by hex so that the map order matches the byte
    /// order of the keys
    struct Rows {
      std::mutex mutex;
      std::map<std::string, Buffer> committed;
    };

    InMemoryLogDatabase();
    ~InMemoryLogDatabase() override = default;

    std::unique_ptr<LogTransaction> begin() override;

    /// Number of committed rows
    size_t size() const;

    std::string GetName() override {
      return "InMemoryLogDatabase";
    }

   private:
    std::shared_ptr<Rows> rows_;
  };

}  // namespace qstore::storage

#endif  // QSTORE_STORAGE_IN_MEMORY_IN_MEMORY_LOG_DATABASE_HPP
