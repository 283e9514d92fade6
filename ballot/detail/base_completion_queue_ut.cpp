#include "ballot/detail/base_completion_queue.hpp"

#include <gtest/gtest.h>
#include <future>
#include <thread>

namespace {
/// Wait for a future for about half a second.
bool wait_ready(std::future<void>& fut) {
  using namespace std::chrono_literals;
  for (int i = 0; i != 10; ++i) {
    if (fut.wait_for(50ms) == std::future_status::ready) {
      return true;
    }
  }
  return false;
}
} // anonymous namespace

/**
 * @test Verify that we can run and shutdown a completion queue.
 */
TEST(base_completion_queue, run_shutdown) {
  ballot::detail::base_completion_queue queue;
  EXPECT_EQ(queue.pending_count(), 0UL);

  // run the event loop in a separate thread ...
  std::promise<void> start;
  std::promise<void> end;
  std::thread t([&]() {
    start.set_value();
    queue.run();
    end.set_value();
  });

  auto start_fut = start.get_future();
  ASSERT_TRUE(wait_ready(start_fut));

  queue.shutdown();
  std::this_thread::sleep_for(ballot::detail::base_completion_queue::loop_timeout);

  auto end_fut = end.get_future();
  ASSERT_TRUE(wait_ready(end_fut));

  t.join();
}

/**
 * @test Verify that shutdown() can be called more than once, and that a queue that never ran can be destroyed.
 */
TEST(base_completion_queue, repeated_shutdown) {
  ballot::detail::base_completion_queue never_ran;

  ballot::detail::base_completion_queue queue;
  std::thread t([&queue]() { queue.run(); });
  queue.shutdown();
  queue.shutdown();
  t.join();
  EXPECT_EQ(queue.pending_count(), 0UL);
}
