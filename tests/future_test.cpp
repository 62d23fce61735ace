#include "async/future.hh"
#include "test_support.hh"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace http_dialog {
namespace {
using test_support::drain;
using test_support::settled_value;

class future_test : public ::testing::Test {
protected:
  asio::io_context ctx;
};

TEST_F(future_test, waiters_run_in_registration_order) {
  promise<int> p{ctx.get_executor()};
  auto f = p.get_future();
  std::vector<std::string> seen;
  f.async_wait([&seen](std::exception_ptr, int v) { seen.push_back("first " + std::to_string(v)); });
  f.async_wait([&seen](std::exception_ptr, int v) { seen.push_back("second " + std::to_string(v)); });
  drain(ctx);
  EXPECT_TRUE(seen.empty());
  EXPECT_FALSE(f.is_ready());

  p.set_value(7);
  // completion is always posted, never run inline
  EXPECT_TRUE(seen.empty());
  drain(ctx);
  EXPECT_EQ(seen, (std::vector<std::string>{"first 7", "second 7"}));
}

TEST_F(future_test, late_waiter_gets_the_value) {
  auto f = make_ready_future(ctx.get_executor(), std::string{"done"});
  EXPECT_TRUE(f.is_ready());
  EXPECT_EQ(settled_value(ctx, f), "done");
}

TEST_F(future_test, first_completion_wins) {
  promise<int> p{ctx.get_executor()};
  p.set_value(1);
  p.set_value(2);
  p.set_exception(std::make_exception_ptr(std::runtime_error("late")));
  EXPECT_EQ(settled_value(ctx, p.get_future()), 1);
}

TEST_F(future_test, failure_is_rethrown_in_coroutine) {
  promise<int> p{ctx.get_executor()};
  auto f = p.get_future();
  std::string caught;
  asio::co_spawn(ctx, [f, &caught]() -> asio::awaitable<void> {
    try {
      co_await f.async_wait(asio::use_awaitable);
    } catch (const connection_error& e) {
      caught = e.what();
    }
  }, asio::detached);
  drain(ctx);
  EXPECT_TRUE(caught.empty());

  p.set_exception(std::make_exception_ptr(connection_error("reset by peer")));
  drain(ctx);
  EXPECT_EQ(caught, "reset by peer");
  EXPECT_TRUE(f.has_failed());
}

TEST_F(future_test, value_is_delivered_to_coroutine) {
  promise<int> p{ctx.get_executor()};
  int got{0};
  asio::co_spawn(ctx, [f = p.get_future(), &got]() -> asio::awaitable<void> {
    got = co_await f.async_wait(asio::use_awaitable);
  }, asio::detached);
  drain(ctx);
  p.set_value(42);
  drain(ctx);
  EXPECT_EQ(got, 42);
}

TEST_F(future_test, dropped_promise_breaks_waiters) {
  future<int> f;
  {
    promise<int> p{ctx.get_executor()};
    auto copy = p;
    f = p.get_future();
  }
  EXPECT_TRUE(f.has_failed());
  EXPECT_THROW(settled_value(ctx, f), broken_promise);
}

TEST_F(future_test, settle_does_not_report_failure) {
  promise<int> p{ctx.get_executor()};
  bool settled{false};
  p.get_future().async_settle([&settled]() { settled = true; });
  p.set_exception(std::make_exception_ptr(std::runtime_error("boom")));
  drain(ctx);
  EXPECT_TRUE(settled);
}

TEST_F(future_test, forward_result_passes_value_and_failure) {
  promise<int> source{ctx.get_executor()};
  promise<int> target{ctx.get_executor()};
  forward_result(source.get_future(), target);
  source.set_value(5);
  EXPECT_EQ(settled_value(ctx, target.get_future()), 5);

  promise<int> failing{ctx.get_executor()};
  promise<int> failed_target{ctx.get_executor()};
  forward_result(failing.get_future(), failed_target);
  failing.set_exception(std::make_exception_ptr(connection_error("gone")));
  EXPECT_THROW(settled_value(ctx, failed_target.get_future()), connection_error);
}

}		// end of local namespace
}	// end of namespace http_dialog
