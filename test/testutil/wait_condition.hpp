#ifndef QSTORE_GTEST_WAIT_CONDITION_HPP
#define QSTORE_GTEST_WAIT_CONDITION_HPP

#include <chrono>
#include <string>
#include <thread>

#include <gtest/gtest.h>

namespace qstore::test {

  /**
   * Poll a condition until it holds or the timeout passes
   * @return true if the condition held in time
   */
  template <typename Condition>
  bool waitForCondition(Condition condition,
                        std::chrono::milliseconds timeout,
                        std::chrono::milliseconds check_interval =
                            std::chrono::milliseconds(10)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!condition()) {
      if (std::chrono::steady_clock::now() >= deadline) {
        return false;
      }
      std::this_thread::sleep_for(check_interval);
    }
    return true;
  }

  /**
   * Assert that a condition becomes true within the timeout
   * @param condition a callable that returns bool, true when condition is met
   * @param timeout maximum time to wait
   * @param description optional description of what we're waiting for
   */
  template <typename Condition>
  void assertWaitForCondition(Condition condition,
                              std::chrono::milliseconds timeout,
                              const std::string &description,
                              const char *file_name,
                              int line_number) {
    if (!waitForCondition(condition, timeout)) {
      std::string message = "Timed out waiting for condition";
      if (!description.empty()) {
        message += ": " + description;
      }
      message += " (timeout: " + std::to_string(timeout.count()) + "ms)";
      GTEST_MESSAGE_AT_(file_name,
                        line_number,
                        message.c_str(),
                        ::testing::TestPartResult::kFatalFailure);
    }
  }

#define ASSERT_WAIT_FOR_CONDITION(condition, timeout, description) \
  qstore::test::assertWaitForCondition(                            \
      condition, timeout, description, __FILE__, __LINE__)

}  // namespace qstore::test

#endif  // QSTORE_GTEST_WAIT_CONDITION_HPP
