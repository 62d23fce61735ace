#pragma once
#include "network_fwd.hh"
#include "errors.hh"
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/execution/outstanding_work.hpp>
#include <boost/asio/prefer.hpp>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace http_dialog {

// A value that is produced once, asynchronously, and may be observed by any number of waiters.
// future<T> is the read side, promise<T> the write side. Both are cheap handles onto a shared state.
//
// Waiting never blocks: future::async_wait takes an asio completion token and completes with
// void(std::exception_ptr, T). With asio::use_awaitable the exception is rethrown inside the coroutine:
//
//   auto conn = co_await connection_future.async_wait(asio::use_awaitable);
//
// Completions are always posted to the waiter's associated executor, in the order the waiters
// were registered, and keep that executor busy (outstanding work) until they ran.
template <typename T> class future;
template <typename T> class promise;

namespace detail {

template <typename T>
struct waiter {
  virtual ~waiter() = default;
  virtual auto complete(std::exception_ptr error, const std::optional<T>& value) -> void = 0;
};

template <typename T, typename Handler, bool Settle>
class handler_waiter final : public waiter<T> {
public:
  handler_waiter(Handler handler, const executor_type& fallback) :
      handler_{std::move(handler)},
      work_{asio::prefer(executor_type{asio::get_associated_executor(handler_, fallback)},
                         asio::execution::outstanding_work.tracked)} {
  }

  auto complete(std::exception_ptr error, const std::optional<T>& value) -> void override {
    auto work{std::move(work_)};
    if constexpr (Settle) {
      asio::post(work, [handler = std::move(handler_)]() mutable {
        std::move(handler)();
      });
    } else {
      asio::post(work, [handler = std::move(handler_), error, value = value.value_or(T{})]() mutable {
        std::move(handler)(error, std::move(value));
      });
    }
  }

private:
  Handler handler_;
  executor_type work_;
};

template <typename T>
class shared_state {
public:
  explicit shared_state(executor_type ex) : executor_{std::move(ex)} {
  }

  auto executor() const -> const executor_type& { return executor_; }

  auto is_ready() const -> bool {
    std::lock_guard lock{mutex_};
    return done_;
  }

  auto has_failed() const -> bool {
    std::lock_guard lock{mutex_};
    return done_ && error_ != nullptr;
  }

  auto add_waiter(std::unique_ptr<waiter<T>> w) -> void {
    std::unique_lock lock{mutex_};
    if (!done_) {
      waiters_.push_back(std::move(w));
      return;
    }
    lock.unlock();
    w->complete(error_, value_);
  }

  // the first completion wins, later ones are ignored
  auto complete(std::exception_ptr error, std::optional<T> value) -> void {
    std::vector<std::unique_ptr<waiter<T>>> ready;
    {
      std::lock_guard lock{mutex_};
      if (done_) {
        return;
      }
      done_ = true;
      error_ = error;
      value_ = std::move(value);
      ready.swap(waiters_);
    }
    // error_ and value_ are immutable from here on
    for (auto& w : ready) {
      w->complete(error_, value_);
    }
  }

private:
  executor_type executor_;
  mutable std::mutex mutex_;
  bool done_{false};
  std::optional<T> value_;
  std::exception_ptr error_;
  std::vector<std::unique_ptr<waiter<T>>> waiters_;
};

// Shared by every copy of a promise. When the last copy goes away without having
// completed the state, waiters receive broken_promise.
template <typename T>
struct promise_owner {
  explicit promise_owner(std::shared_ptr<shared_state<T>> s) : state{std::move(s)} {
  }
  promise_owner(const promise_owner&) = delete;
  promise_owner& operator=(const promise_owner&) = delete;
  ~promise_owner() {
    state->complete(std::make_exception_ptr(broken_promise{}), std::nullopt);
  }

  std::shared_ptr<shared_state<T>> state;
};

}	// end of namespace detail

template <typename T>
class future {
  static_assert(std::is_default_constructible_v<T>, "future values must be default constructible");
public:
  using value_type = T;

  future() = default;

  auto valid() const -> bool { return state_ != nullptr; }
  auto is_ready() const -> bool { return state_->is_ready(); }
  auto has_failed() const -> bool { return state_->has_failed(); }
  auto get_executor() const -> const executor_type& { return state_->executor(); }

  // Completes with void(std::exception_ptr, T) once the value or the failure is available
  template <typename CompletionToken>
  auto async_wait(CompletionToken&& token) const {
    return asio::async_initiate<CompletionToken, void(std::exception_ptr, T)>(
        [state = state_](auto handler) {
          using handler_type = std::decay_t<decltype(handler)>;
          state->add_waiter(std::make_unique<detail::handler_waiter<T, handler_type, false>>(
              std::move(handler), state->executor()));
        }, token);
  }

  // Completes with void() once the value is available or has failed, without reporting which
  template <typename CompletionToken>
  auto async_settle(CompletionToken&& token) const {
    return asio::async_initiate<CompletionToken, void()>(
        [state = state_](auto handler) {
          using handler_type = std::decay_t<decltype(handler)>;
          state->add_waiter(std::make_unique<detail::handler_waiter<T, handler_type, true>>(
              std::move(handler), state->executor()));
        }, token);
  }

private:
  friend class promise<T>;
  explicit future(std::shared_ptr<detail::shared_state<T>> state) : state_{std::move(state)} {
  }

  std::shared_ptr<detail::shared_state<T>> state_;
};

template <typename T>
class promise {
public:
  explicit promise(executor_type ex) :
      owner_{std::make_shared<detail::promise_owner<T>>(std::make_shared<detail::shared_state<T>>(std::move(ex)))} {
  }

  auto get_future() const -> future<T> { return future<T>{owner_->state}; }

  auto set_value(T value) -> void {
    owner_->state->complete(nullptr, std::optional<T>{std::move(value)});
  }

  auto set_exception(std::exception_ptr error) -> void {
    owner_->state->complete(error, std::nullopt);
  }

private:
  std::shared_ptr<detail::promise_owner<T>> owner_;
};

template <typename T>
auto make_ready_future(executor_type ex, T value) -> future<T> {
  promise<T> p{std::move(ex)};
  p.set_value(std::move(value));
  return p.get_future();
}

template <typename T>
auto make_failed_future(executor_type ex, std::exception_ptr error) -> future<T> {
  promise<T> p{std::move(ex)};
  p.set_exception(error);
  return p.get_future();
}

// Completes `to` with whatever `from` settles with
template <typename T>
auto forward_result(const future<T>& from, promise<T> to) -> void {
  from.async_wait([to = std::move(to)](std::exception_ptr error, T value) mutable {
    if (error) {
      to.set_exception(error);
    } else {
      to.set_value(std::move(value));
    }
  });
}

}	// end of namespace http_dialog
