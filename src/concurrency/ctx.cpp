#include "concurrency/ctx.hpp"

#include <algorithm>
#include <vector>

OUTCOME_CPP_DEFINE_CATEGORY_3(qstore::concurrency, CtxError, e) {
  using E = qstore::concurrency::CtxError;
  switch (e) {
    case E::CANCELED:
      return "context canceled";
    case E::DEADLINE_EXCEEDED:
      return "context deadline exceeded";
  }
  return "unknown context error";
}

namespace qstore::concurrency {

  struct Ctx::State {
    std::shared_ptr<State> parent;
    boost::optional<TimePoint> deadline;

    mutable std::mutex mutex;
    std::condition_variable cv;
    bool canceled = false;
    std::vector<std::weak_ptr<State>> children;

    bool isCanceled() const {
      {
        std::lock_guard<std::mutex> lock(mutex);
        if (canceled) {
          return true;
        }
      }
      return parent && parent->isCanceled();
    }

    void wake() {
      std::vector<std::weak_ptr<State>> to_wake;
      {
        std::lock_guard<std::mutex> lock(mutex);
        to_wake = children;
      }
      cv.notify_all();
      for (auto &weak : to_wake) {
        if (auto child = weak.lock()) {
          child->wake();
        }
      }
    }
  };

  bool isCanceled(const std::error_code &ec) {
    return ec == CtxError::CANCELED || ec == CtxError::DEADLINE_EXCEEDED;
  }

  Ctx::Ctx(std::shared_ptr<State> state) : state_{std::move(state)} {}

  Ctx Ctx::background() {
    return Ctx{std::make_shared<State>()};
  }

  Ctx Ctx::withCancel() const {
    auto child = std::make_shared<State>();
    child->parent = state_;
    child->deadline = state_->deadline;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      // drop children that are gone, so long-lived roots do not grow forever
      auto &children = state_->children;
      children.erase(
          std::remove_if(children.begin(),
                         children.end(),
                         [](const auto &weak) { return weak.expired(); }),
          children.end());
      children.push_back(child);
    }
    return Ctx{std::move(child)};
  }

  Ctx Ctx::withTimeout(Duration timeout) const {
    return withDeadline(Clock::now() + timeout);
  }

  Ctx Ctx::withDeadline(TimePoint deadline) const {
    auto child = withCancel();
    if (!child.state_->deadline || deadline < *child.state_->deadline) {
      child.state_->deadline = deadline;
    }
    return child;
  }

  void Ctx::cancel() const {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->canceled = true;
    }
    state_->wake();
  }

  bool Ctx::isActive() const {
    return !check().has_error();
  }

  boost::optional<Ctx::TimePoint> Ctx::deadline() const {
    return state_->deadline;
  }

  outcome::result<void> Ctx::check() const {
    if (state_->isCanceled()) {
      return CtxError::CANCELED;
    }
    if (state_->deadline && Clock::now() >= *state_->deadline) {
      return CtxError::DEADLINE_EXCEEDED;
    }
    return outcome::success();
  }

  outcome::result<void> Ctx::sleep(Duration duration) const {
    auto wake_at = Clock::now() + duration;
    if (state_->deadline && *state_->deadline < wake_at) {
      wake_at = *state_->deadline;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    while (true) {
      // cancel() sets the flag before waking, so checking the chain under the
      // lock cannot miss a notification
      if (state_->canceled
          || (state_->parent && state_->parent->isCanceled())) {
        return CtxError::CANCELED;
      }
      auto now = Clock::now();
      if (state_->deadline && now >= *state_->deadline) {
        return CtxError::DEADLINE_EXCEEDED;
      }
      if (now >= wake_at) {
        return outcome::success();
      }
      state_->cv.wait_until(lock, wake_at);
    }
  }

}  // namespace qstore::concurrency
