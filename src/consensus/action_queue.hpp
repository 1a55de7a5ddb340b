#ifndef QSTORE_CONSENSUS_ACTION_QUEUE_HPP
#define QSTORE_CONSENSUS_ACTION_QUEUE_HPP

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

#include "concurrency/ctx.hpp"
#include "consensus/sync_action.hpp"

namespace qstore::consensus {

  /**
   * Bounded FIFO of sync actions between the consensus bridge and the
   * execution pipeline. Actions of one block are enqueued together, so the
   * receiver never observes a partially enqueued block.
   */
  class ActionQueue {
   public:
    explicit ActionQueue(size_t capacity);

    /**
     * Enqueue the actions once there is room for all of them. A batch
     * larger than the capacity waits for the queue to drain completely.
     */
    outcome::result<void> pushActions(const concurrency::Ctx &ctx,
                                      std::vector<SyncAction> actions);

    /// Wait for the next action
    outcome::result<SyncAction> popAction(const concurrency::Ctx &ctx);

    boost::optional<SyncAction> tryPopAction();

    size_t size() const;

    size_t capacity() const {
      return capacity_;
    }

   private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<SyncAction> actions_;
  };

  /// Sending end of an ActionQueue handed to the consensus bridge
  class ActionQueueSender {
   public:
    explicit ActionQueueSender(std::shared_ptr<ActionQueue> queue)
        : queue_{std::move(queue)} {}

    outcome::result<void> pushActions(const concurrency::Ctx &ctx,
                                      std::vector<SyncAction> actions) const {
      return queue_->pushActions(ctx, std::move(actions));
    }

   private:
    std::shared_ptr<ActionQueue> queue_;
  };

}  // namespace qstore::consensus

#endif  // QSTORE_CONSENSUS_ACTION_QUEUE_HPP
