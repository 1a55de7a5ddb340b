#ifndef QSTORE_CONCURRENCY_CTX_HPP
#define QSTORE_CONCURRENCY_CTX_HPP

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

#include <boost/optional.hpp>
#include "outcome/outcome.hpp"

namespace qstore::concurrency {

  /**
   * Reasons for which a context stops being active
   */
  enum class CtxError {
    CANCELED = 1,
    DEADLINE_EXCEEDED,
  };

  /**
   * @return true if the error was produced by a cancelled or expired context
   */
  bool isCanceled(const std::error_code &ec);

  /**
   * @brief Cancellation and deadline scope passed to every operation that may
   * wait. Copies share state; children created with withCancel() or
   * withTimeout() are cancelled together with their parent, but cancelling a
   * child leaves the parent active.
   */
  class Ctx {
   public:
    using Clock = std::chrono::steady_clock;
    using Duration = Clock::duration;
    using TimePoint = Clock::time_point;

    /// Granularity at which waits on foreign condition variables re-check
    /// the context
    static constexpr std::chrono::milliseconds kCheckInterval{10};

    /// Root context, never cancelled unless cancel() is called on it
    static Ctx background();

    [[nodiscard]] Ctx withCancel() const;

    [[nodiscard]] Ctx withTimeout(Duration timeout) const;

    [[nodiscard]] Ctx withDeadline(TimePoint deadline) const;

    /// Cancels this context and all of its children, waking their sleeps
    void cancel() const;

    [[nodiscard]] bool isActive() const;

    [[nodiscard]] boost::optional<TimePoint> deadline() const;

    /// @return success while active, otherwise the reason it stopped
    outcome::result<void> check() const;

    /**
     * Suspend the caller for the given duration
     * @return success after the full duration, CtxError if the context was
     * cancelled or its deadline passed first
     */
    outcome::result<void> sleep(Duration duration) const;

    /**
     * Wait on a foreign condition variable until pred() holds, the context
     * stops, or wait_until passes
     * @return success if pred() became true, CtxError otherwise; a boolean
     * false value means wait_until passed first
     */
    template <typename Predicate>
    outcome::result<bool> wait(std::unique_lock<std::mutex> &lock,
                               std::condition_variable &cv,
                               Predicate pred,
                               boost::optional<TimePoint> wait_until) const {
      while (!pred()) {
        BOOST_OUTCOME_TRYV2(auto &&, check());
        auto now = Clock::now();
        if (wait_until && now >= *wait_until) {
          return false;
        }
        auto until = now + kCheckInterval;
        if (wait_until && *wait_until < until) {
          until = *wait_until;
        }
        cv.wait_until(lock, until);
      }
      return true;
    }

   private:
    struct State;

    explicit Ctx(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
  };

}  // namespace qstore::concurrency

OUTCOME_HPP_DECLARE_ERROR_2(qstore::concurrency, CtxError);

#endif  // QSTORE_CONCURRENCY_CTX_HPP
