#ifndef QSTORE_STORAGE_IN_MEMORY_IN_MEMORY_LOG_TRANSACTION_HPP
#define QSTORE_STORAGE_IN_MEMORY_IN_MEMORY_LOG_TRANSACTION_HPP

#include <set>
#include <vector>

#include "storage/in_memory/in_memory_log_database.hpp"

namespace qstore::storage {

  class InMemoryLogTransaction : public LogTransaction {
   public:
    explicit InMemoryLogTransaction(
        std::shared_ptr<InMemoryLogDatabase::Rows> rows);
    ~InMemoryLogTransaction() override;

    outcome::result<Buffer> get(const Buffer &key) const override;

    outcome::result<void> put(const Buffer &key,
                              const Buffer &value) override;

    outcome::result<void> insert(const Buffer &key,
                                 const Buffer &value) override;

    outcome::result<void> remove(const Buffer &key) override;

    outcome::result<boost::optional<LogEntry>> first(
        const Buffer &prefix) const override;

    outcome::result<boost::optional<LogEntry>> last(
        const Buffer &prefix) const override;

    void setSavePoint() override;

    outcome::result<void> rollbackToSavePoint() override;

    outcome::result<void> popSavePoint() override;

    outcome::result<void> commit() override;

    void rollback() override;

   private:
    /// Uncommitted writes, none marks a removal
    struct WriteSet {
      std::map<std::string, boost::optional<Buffer>> writes;
      std::set<std::string> inserted;
    };

    /// Committed value overlaid with the write set
    boost::optional<Buffer> lookup(const std::string &key) const;

    std::shared_ptr<InMemoryLogDatabase::Rows> rows_;
    WriteSet current_;
    std::vector<WriteSet> save_points_;
    bool finished_ = false;
  };

}  // namespace qstore::storage

#endif  // QSTORE_STORAGE_IN_MEMORY_IN_MEMORY_LOG_TRANSACTION_HPP
