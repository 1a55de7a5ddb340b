#include "consensus/action_queue.hpp"

#include <algorithm>

namespace qstore::consensus {

  ActionQueue::ActionQueue(size_t capacity)
      : capacity_{std::max<size_t>(capacity, 1)} {}

  outcome::result<void> ActionQueue::pushActions(
      const concurrency::Ctx &ctx, std::vector<SyncAction> actions) {
    if (actions.empty()) {
      return outcome::success();
    }
    auto needed = std::min(actions.size(), capacity_);
    {
      std::unique_lock<std::mutex> lock(mutex_);
      OUTCOME_TRY((auto &&, ready),
                  ctx.wait(
                      lock,
                      cv_,
                      [&] { return actions_.size() + needed <= capacity_; },
                      boost::none));
      (void)ready;
      std::move(actions.begin(), actions.end(), std::back_inserter(actions_));
    }
    cv_.notify_all();
    return outcome::success();
  }

  outcome::result<SyncAction> ActionQueue::popAction(
      const concurrency::Ctx &ctx) {
    std::unique_lock<std::mutex> lock(mutex_);
    OUTCOME_TRY((auto &&, ready),
                ctx.wait(
                    lock, cv_, [&] { return !actions_.empty(); }, boost::none));
    (void)ready;
    auto action = std::move(actions_.front());
    actions_.pop_front();
    lock.unlock();
    cv_.notify_all();
    return action;
  }

  boost::optional<SyncAction> ActionQueue::tryPopAction() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (actions_.empty()) {
      return boost::none;
    }
    auto action = std::move(actions_.front());
    actions_.pop_front();
    lock.unlock();
    cv_.notify_all();
    return action;
  }

  size_t ActionQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return actions_.size();
  }

}  // namespace qstore::consensus
