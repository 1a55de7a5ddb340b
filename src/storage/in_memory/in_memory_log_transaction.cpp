#include "storage/in_memory/in_memory_log_transaction.hpp"

#include "storage/database_error.hpp"

namespace qstore::storage {

  namespace {
    // hex keys only contain [0-9a-f]
    const char kPastHexDigit = 'g';

    bool hasPrefix(const std::string &key, const std::string &prefix) {
      return key.compare(0, prefix.size(), prefix) == 0;
    }

    template <typename Map>
    auto lowerBound(const Map &map, const std::string &prefix) {
      return map.lower_bound(prefix);
    }

    template <typename Map>
    auto upperBound(const Map &map, const std::string &prefix) {
      return map.lower_bound(prefix + kPastHexDigit);
    }

    outcome::result<LogEntry> makeEntry(const std::string &key,
                                        const Buffer &value) {
      OUTCOME_TRY((auto &&, k), Buffer::fromHex(key));
      return LogEntry{std::move(k), value};
    }
  }  // namespace

  InMemoryLogTransaction::InMemoryLogTransaction(
      std::shared_ptr<InMemoryLogDatabase::Rows> rows)
      : rows_{std::move(rows)} {}

  InMemoryLogTransaction::~InMemoryLogTransaction() {
    rollback();
  }

  boost::optional<Buffer> InMemoryLogTransaction::lookup(
      const std::string &key) const {
    auto w = current_.writes.find(key);
    if (w != current_.writes.end()) {
      return w->second;
    }
    std::lock_guard<std::mutex> lock(rows_->mutex);
    auto c = rows_->committed.find(key);
    if (c != rows_->committed.end()) {
      return c->second;
    }
    return boost::none;
  }

  outcome::result<Buffer> InMemoryLogTransaction::get(
      const Buffer &key) const {
    if (finished_) {
      return DatabaseError::NO_TRANSACTION;
    }
    auto value = lookup(key.toHex());
    if (!value) {
      return DatabaseError::NOT_FOUND;
    }
    return std::move(*value);
  }

  outcome::result<void> InMemoryLogTransaction::put(const Buffer &key,
                                                    const Buffer &value) {
    if (finished_) {
      return DatabaseError::NO_TRANSACTION;
    }
    current_.writes[key.toHex()] = value;
    return outcome::success();
  }

  outcome::result<void> InMemoryLogTransaction::insert(const Buffer &key,
                                                       const Buffer &value) {
    if (finished_) {
      return DatabaseError::NO_TRANSACTION;
    }
    auto hex = key.toHex();
    if (lookup(hex)) {
      return DatabaseError::DUPLICATE_KEY;
    }
    current_.writes[hex] = value;
    current_.inserted.insert(hex);
    return outcome::success();
  }

  outcome::result<void> InMemoryLogTransaction::remove(const Buffer &key) {
    if (finished_) {
      return DatabaseError::NO_TRANSACTION;
    }
    auto hex = key.toHex();
    current_.writes[hex] = boost::none;
    current_.inserted.erase(hex);
    return outcome::success();
  }

  outcome::result<boost::optional<LogEntry>> InMemoryLogTransaction::first(
      const Buffer &prefix) const {
    if (finished_) {
      return DatabaseError::NO_TRANSACTION;
    }
    auto hex = prefix.toHex();
    boost::optional<std::string> best;

    // smallest live key among own writes
    for (auto it = lowerBound(current_.writes, hex);
         it != current_.writes.end() && hasPrefix(it->first, hex);
         ++it) {
      if (it->second) {
        best = it->first;
        break;
      }
    }

    std::unique_lock<std::mutex> lock(rows_->mutex);
    const auto &committed = rows_->committed;
    for (auto it = lowerBound(committed, hex);
         it != committed.end() && hasPrefix(it->first, hex);
         ++it) {
      if (best && *best < it->first) {
        break;
      }
      auto w = current_.writes.find(it->first);
      if (w == current_.writes.end()) {
        best = it->first;
        break;
      }
    }
    lock.unlock();

    if (!best) {
      return boost::none;
    }
    auto value = lookup(*best);
    if (!value) {
      return boost::none;
    }
    OUTCOME_TRY((auto &&, entry), makeEntry(*best, *value));
    return boost::optional<LogEntry>{std::move(entry)};
  }

  outcome::result<boost::optional<LogEntry>> InMemoryLogTransaction::last(
      const Buffer &prefix) const {
    if (finished_) {
      return DatabaseError::NO_TRANSACTION;
    }
    auto hex = prefix.toHex();
    boost::optional<std::string> best;

    for (auto it = std::make_reverse_iterator(upperBound(current_.writes, hex));
         it != current_.writes.rend() && hasPrefix(it->first, hex);
         ++it) {
      if (it->second) {
        best = it->first;
        break;
      }
    }

    std::unique_lock<std::mutex> lock(rows_->mutex);
    const auto &committed = rows_->committed;
    for (auto it = std::make_reverse_iterator(upperBound(committed, hex));
         it != committed.rend() && hasPrefix(it->first, hex);
         ++it) {
      if (best && it->first < *best) {
        break;
      }
      auto w = current_.writes.find(it->first);
      if (w == current_.writes.end()) {
        best = it->first;
        break;
      }
    }
    lock.unlock();

    if (!best) {
      return boost::none;
    }
    auto value = lookup(*best);
    if (!value) {
      return boost::none;
    }
    OUTCOME_TRY((auto &&, entry), makeEntry(*best, *value));
    return boost::optional<LogEntry>{std::move(entry)};
  }

  void InMemoryLogTransaction::setSavePoint() {
    save_points_.push_back(current_);
  }

  outcome::result<void> InMemoryLogTransaction::rollbackToSavePoint() {
    if (finished_ || save_points_.empty()) {
      return DatabaseError::NO_TRANSACTION;
    }
    current_ = std::move(save_points_.back());
    save_points_.pop_back();
    return outcome::success();
  }

  outcome::result<void> InMemoryLogTransaction::popSavePoint() {
    if (finished_ || save_points_.empty()) {
      return DatabaseError::NO_TRANSACTION;
    }
    save_points_.pop_back();
    return outcome::success();
  }

  outcome::result<void> InMemoryLogTransaction::commit() {
    if (finished_) {
      return DatabaseError::NO_TRANSACTION;
    }
    finished_ = true;
    save_points_.clear();
    auto writes = std::move(current_);
    current_ = WriteSet{};

    std::lock_guard<std::mutex> lock(rows_->mutex);
    auto &committed = rows_->committed;
    // a concurrent transaction may have committed the same key meanwhile
    for (const auto &key : writes.inserted) {
      if (committed.find(key) != committed.end()) {
        return DatabaseError::DUPLICATE_KEY;
      }
    }
    for (auto &[key, value] : writes.writes) {
      if (value) {
        committed[key] = std::move(*value);
      } else {
        committed.erase(key);
      }
    }
    return outcome::success();
  }

  void InMemoryLogTransaction::rollback() {
    finished_ = true;
    save_points_.clear();
    current_ = WriteSet{};
  }

}  // namespace qstore::storage
