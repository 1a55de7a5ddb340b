#include "concurrency/ctx.hpp"

#include <thread>

#include <gtest/gtest.h>
#include "testutil/outcome.hpp"

using namespace qstore::concurrency;
using namespace std::chrono_literals;

/**
 * @given background context
 * @when it is checked and slept on
 * @then it is active and the sleep completes
 */
TEST(CtxTest, BackgroundIsActive) {
  auto ctx = Ctx::background();
  EXPECT_TRUE(ctx.isActive());
  EXPECT_FALSE(ctx.deadline());
  EXPECT_OUTCOME_TRUE_1(ctx.sleep(1ms));
}

/**
 * @given a parent with a child context
 * @when the child is cancelled
 * @then the parent stays active, and cancelling the parent stops a new child
 */
TEST(CtxTest, CancelPropagatesDownOnly) {
  auto parent = Ctx::background().withCancel();
  auto child = parent.withCancel();

  child.cancel();
  EXPECT_OUTCOME_ERROR(child.check(), CtxError::CANCELED);
  EXPECT_TRUE(parent.isActive());

  auto other = parent.withCancel();
  parent.cancel();
  EXPECT_OUTCOME_ERROR(other.check(), CtxError::CANCELED);
}

/**
 * @given context with a short timeout
 * @when sleeping longer than the timeout
 * @then the sleep ends early with DEADLINE_EXCEEDED
 */
TEST(CtxTest, SleepStopsAtDeadline) {
  auto ctx = Ctx::background().withTimeout(20ms);
  auto started = Ctx::Clock::now();
  auto res = ctx.sleep(10s);
  ASSERT_FALSE(res);
  EXPECT_EQ(res.error(), CtxError::DEADLINE_EXCEEDED);
  EXPECT_TRUE(isCanceled(res.error()));
  EXPECT_LT(Ctx::Clock::now() - started, 5s);
}

/**
 * @given a nested deadline later than the parent's
 * @when the child is created
 * @then the earlier deadline wins
 */
TEST(CtxTest, ChildKeepsEarlierDeadline) {
  auto parent = Ctx::background().withTimeout(1s);
  auto child = parent.withTimeout(1h);
  ASSERT_TRUE(child.deadline());
  EXPECT_EQ(*child.deadline(), *parent.deadline());
}

/**
 * @given a thread sleeping on a child context
 * @when its root is cancelled from another thread
 * @then the sleep wakes with CANCELED
 */
TEST(CtxTest, CancelWakesSleepingChild) {
  auto root = Ctx::background().withCancel();
  auto child = root.withCancel();

  outcome::result<void> res = outcome::success();
  std::thread sleeper([&] { res = child.sleep(1h); });
  std::this_thread::sleep_for(20ms);
  root.cancel();
  sleeper.join();

  ASSERT_FALSE(res);
  EXPECT_EQ(res.error(), CtxError::CANCELED);
}

/**
 * @given a condition variable that is never signalled
 * @when waiting on it with a wait limit
 * @then wait returns false once the limit passes
 */
TEST(CtxTest, WaitReturnsFalseAfterLimit) {
  std::mutex mutex;
  std::condition_variable cv;
  std::unique_lock<std::mutex> lock(mutex);
  auto ctx = Ctx::background();
  EXPECT_OUTCOME_TRUE(
      ready, ctx.wait(lock, cv, [] { return false; }, Ctx::Clock::now() + 20ms));
  EXPECT_FALSE(ready);
}
