#include "ballot/active_completion_queue.hpp"

#include <gtest/gtest.h>
#include <future>

/**
 * @test Verify that ballot::active_completion_queue can be created and destroyed.
 */
TEST(active_completion_queue, basic) {
  auto shq = std::make_shared<ballot::active_completion_queue>();
  EXPECT_EQ(shq->cq().pending_count(), 0U);
  EXPECT_NO_THROW(shq.reset());

  EXPECT_NO_THROW(ballot::active_completion_queue());
}

/**
 * @test Verify that the callbacks run in the thread owned by ballot::active_completion_queue.
 */
TEST(active_completion_queue, callbacks_in_loop_thread) {
  using namespace std::chrono_literals;
  ballot::active_completion_queue queue;
  EXPECT_FALSE(queue.in_loop_thread());

  std::promise<bool> in_loop;
  auto timer = queue.cq().make_relative_timer(
      5ms, "test/in_loop_thread", [&queue, &in_loop](auto const&, bool) { in_loop.set_value(queue.in_loop_thread()); });
  auto fut = in_loop.get_future();
  ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
  EXPECT_TRUE(fut.get());
}

