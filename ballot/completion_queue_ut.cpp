#include "ballot/completion_queue.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <thread>

namespace ballot {
namespace detail {
struct base_completion_queue_test_only {
  static grpc::CompletionQueue* get_raw_queue(base_completion_queue& q) {
    return q.cq();
  }
};
} // namespace detail
} // namespace ballot

namespace {
using namespace std::chrono_literals;

/// Run a ballot::completion_queue in a separate thread for the duration of a test.
class queue_runner {
public:
  queue_runner()
      : queue()
      , thread_([this]() { queue.run(); }) {
  }
  ~queue_runner() {
    queue.shutdown();
    thread_.join();
  }

  ballot::completion_queue<> queue;

private:
  std::thread thread_;
};

template <typename predicate>
bool wait_until(predicate&& p) {
  for (int i = 0; i != 200; ++i) {
    if (p()) {
      return true;
    }
    std::this_thread::sleep_for(10ms);
  }
  return p();
}
} // anonymous namespace

/**
 * @test Verify that timers fire, and cancelled timers report the cancellation.
 */
TEST(completion_queue, timers) {
  queue_runner r;

  std::atomic<int> fired(0);
  std::atomic<int> cancelled(0);
  auto functor = [&fired, &cancelled](auto const& op, bool ok) {
    if (ok) {
      ++fired;
    } else {
      ++cancelled;
    }
  };

  auto refresh = r.queue.make_relative_timer(10ms, "session/ttl_refresh", functor);
  auto retry = r.queue.make_relative_timer(1h, "election/retry", functor);
  retry->cancel();

  ASSERT_TRUE(wait_until([&]() { return fired.load() == 1 and cancelled.load() == 1; }));
  EXPECT_TRUE(wait_until([&]() { return r.queue.pending_count() == 0; }));
}

/**
 * @test Verify that the timer callbacks receive the name and deadline of the timer.
 */
TEST(completion_queue, timer_attributes) {
  queue_runner r;

  auto deadline = std::chrono::system_clock::now() + 5ms;
  std::promise<std::string> name;
  std::promise<std::chrono::system_clock::time_point> when;
  r.queue.make_deadline_timer(deadline, "node-watch/recheck", [&name, &when](auto const& op, bool ok) {
    name.set_value(op.name);
    when.set_value(op.deadline);
  });

  auto fname = name.get_future();
  auto fwhen = when.get_future();
  ASSERT_EQ(std::future_status::ready, fname.wait_for(2s));
  EXPECT_EQ("node-watch/recheck", fname.get());
  EXPECT_EQ(deadline, fwhen.get());
}

/**
 * @test Verify that tags the queue did not register are skipped, and the loop keeps running.
 */
TEST(completion_queue, unknown_tags) {
  queue_runner r;
  grpc::CompletionQueue* cq = ballot::detail::base_completion_queue_test_only::get_raw_queue(r.queue);

  std::atomic<int> cnt(0);
  // ... alarms created directly on the gRPC queue, neither tag is known to the wrapper ...
  grpc::Alarm stray_null(cq, std::chrono::system_clock::now() + 5ms, nullptr);
  grpc::Alarm stray(cq, std::chrono::system_clock::now() + 10ms, static_cast<void*>(&cnt));
  r.queue.make_relative_timer(30ms, "after-stray-alarms", [&cnt](auto const& op, bool ok) { ++cnt; });

  ASSERT_TRUE(wait_until([&cnt]() { return cnt.load() != 0; }));
  EXPECT_EQ(1, cnt.load());
}

/**
 * @test Verify that exceptions raised by callbacks do not stop the loop.
 */
TEST(completion_queue, callback_exception) {
  queue_runner r;

  std::atomic<int> cnt(0);
  r.queue.make_relative_timer(5ms, "throws", [](auto const& op, bool ok) {
    throw std::runtime_error("raised in callback");
  });
  r.queue.make_relative_timer(20ms, "counts", [&cnt](auto const& op, bool ok) { ++cnt; });

  ASSERT_TRUE(wait_until([&cnt]() { return cnt.load() != 0; }));
}
