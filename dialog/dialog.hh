#pragma once
#include "async/future.hh"
#include "config/client_config.hh"
#include "dialog/accumulator.hh"
#include "dialog/connection.hh"
#include "log/logging.hh"
#include "network_fwd.hh"
#include <atomic>
#include <concepts>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace http_dialog {

// Produces the rest of a chunked request body and hands back the response future, usually
// by calling send_chunk() any number of times followed by close_stream()
using chunker_fn = std::function<future<http_response>(std::shared_ptr<chunked_requester>)>;
using reply_fn = std::function<http_request(const http_response&)>;

namespace detail {

auto arrive(future<http_response> pending) -> asio::awaitable<http_response>;
auto arrive(std::vector<future<http_response>> pending) -> asio::awaitable<response_sequence>;

template <typename Pending>
using arrival_t = typename decltype(arrive(std::declval<Pending>()))::value_type;

auto issue(connection& conn, const http_request& request, promise<http_response> response) -> void;
auto issue_chunked(connection_ptr conn, http_request request, chunker_fn chunker,
                   promise<http_response> response) -> asio::awaitable<void>;
auto issue_reply(connection_ptr conn, future<http_response> answered, reply_fn f,
                 promise<http_response> response) -> asio::awaitable<void>;
auto idle_for(std::shared_ptr<scheduler> timers, scheduler::duration idle, executor_type ex) -> asio::awaitable<void>;
auto close_once(future<connection_ptr> connection, future<connection_ptr> established,
                std::shared_ptr<std::atomic_bool> closed) -> asio::awaitable<void>;

}	// end of namespace detail

// An exchange of HTTP messages over one connection, described up front as a chain of steps:
//
//   auto result = open_dialog(ex, registry, "example.com")
//                     .send(http_request::get("/a"))
//                     .send(http_request::get("/b"))    // pipelined behind /a
//                     .await_response()                 // nothing below goes out before /a and /b answered
//                     .wait_idle(100ms)
//                     .send(http_request::get("/c"))
//                     .end();                           // future<response_sequence>
//
// A dialog couples two chains of pending values: the connection chain, which decides when the
// next request may go out, and the result chain, which collects the responses in issue order.
// R records what has been collected so far (empty_result, http_response or response_sequence).
// Every call returns a new dialog and never blocks; the steps run as coroutines on the dialog's
// executor as soon as their inputs are available.
//
// There is no cancellation. Dropping a dialog leaves the steps it already spawned running to
// completion, in-flight requests and timers included.
template <accumulated R>
class dialog {
public:
  using result_type = R;

  dialog(executor_type ex, std::shared_ptr<scheduler> timers, future<connection_ptr> connection,
         future<connection_ptr> established, future<R> result, std::shared_ptr<std::atomic_bool> closed) :
      executor_{std::move(ex)}, scheduler_{std::move(timers)}, connection_{std::move(connection)},
      established_{std::move(established)}, result_{std::move(result)}, closed_{std::move(closed)} {
  }

  /// Send `request` as soon as the connection is free. Sends that are not separated by
  /// await_response()/wait_idle() are pipelined, each one right after the other.
  auto send(http_request request) const -> dialog<next_result_t<R, http_response>>;

  /// Send all `requests` back to back, their responses join the result as one ordered batch
  auto send(std::vector<http_request> requests) const -> dialog<response_sequence>;

  /// Like send() but the body is streamed by `chunker`. The connection is handed on once the
  /// body was closed with close_stream(), without waiting for the response. A chunker that lets
  /// go of its requester without closing it fails this response and releases the connection.
  auto send_chunked(http_request request, chunker_fn chunker) const -> dialog<next_result_t<R, http_response>>;

  /// Answer the single pending response with the request `f` derives from it.
  /// Only available right after exactly one send.
  auto reply(reply_fn f) const -> dialog<response_sequence> requires std::same_as<R, http_response> {
    promise<http_response> response{executor_};
    auto pending = response.get_future();
    auto connection = then_connection(
        [answered = result_, f = std::move(f), response = std::move(response)](connection_ptr conn) -> asio::awaitable<void> {
          co_await detail::issue_reply(std::move(conn), answered, f, response);
        });
    return extend(std::move(connection), then_result(std::move(pending)));
  }

  /// Hold back every later send until all responses so far have come in (or failed)
  auto await_response() const -> dialog<R>;

  /// Hold back every later send for `idle`, responses are not waited for
  auto wait_idle(scheduler::duration idle) const -> dialog<R>;

  /// The final result. Once the result chain settled the connection is closed (once per dialog),
  /// then the returned future completes with the result or with the failure that broke the chain.
  /// A failing close is logged and does not affect the result.
  auto end() const -> future<R>;

private:
  template <typename Step>
  auto then_connection(Step step) const -> future<connection_ptr>;

  template <typename Pending>
  auto then_result(Pending pending) const -> future<next_result_t<R, detail::arrival_t<Pending>>>;

  template <accumulated N>
  auto extend(future<connection_ptr> connection, future<N> result) const -> dialog<N> {
    return dialog<N>{executor_, scheduler_, std::move(connection), established_, std::move(result), closed_};
  }

  executor_type executor_;
  std::shared_ptr<scheduler> scheduler_;
  future<connection_ptr> connection_;
  // the connection as opened, closed by end() when a later step broke the connection chain
  future<connection_ptr> established_;
  future<R> result_;
  // shared by all dialogs grown from the same open_dialog call
  std::shared_ptr<std::atomic_bool> closed_;
};

/// Start a dialog with host:port through the connection the registry hands out for `endpoint_id`.
/// The result starts out empty and fails if the connection cannot be established.
auto open_dialog(executor_type ex, endpoint_registry& registry, const std::string& host,
                 std::uint16_t port = client_config::DEFAULT_PORT,
                 const std::string& endpoint_id = client_config::DEFAULT_ENDPOINT_ID) -> dialog<empty_result>;

auto open_dialog(executor_type ex, endpoint_registry& registry, const std::string& host,
                 const client_config& config) -> dialog<empty_result>;

// with an explicit timer source for wait_idle()
auto open_dialog(executor_type ex, std::shared_ptr<scheduler> timers, endpoint_registry& registry,
                 const std::string& host, std::uint16_t port, const std::string& endpoint_id) -> dialog<empty_result>;

template <accumulated R>
template <typename Step>
auto dialog<R>::then_connection(Step step) const -> future<connection_ptr> {
  promise<connection_ptr> next{executor_};
  auto handle = next.get_future();
  asio::co_spawn(executor_,
      [current = connection_, step = std::move(step), next = std::move(next)]() mutable -> asio::awaitable<void> {
        try {
          auto conn = co_await current.async_wait(asio::use_awaitable);
          co_await step(conn);
          next.set_value(std::move(conn));
        } catch (...) {
          next.set_exception(std::current_exception());
        }
      }, asio::detached);
  return handle;
}

template <accumulated R>
template <typename Pending>
auto dialog<R>::then_result(Pending pending) const -> future<next_result_t<R, detail::arrival_t<Pending>>> {
  using next_type = next_result_t<R, detail::arrival_t<Pending>>;
  promise<next_type> next{executor_};
  auto handle = next.get_future();
  asio::co_spawn(executor_,
      [current = result_, pending = std::move(pending), next = std::move(next)]() mutable -> asio::awaitable<void> {
        try {
          // the earlier part of the chain decides the failure, even if this arrival failed first
          auto so_far = co_await current.async_wait(asio::use_awaitable);
          auto arrived = co_await detail::arrive(std::move(pending));
          next.set_value(concat(std::move(so_far), std::move(arrived)));
        } catch (...) {
          next.set_exception(std::current_exception());
        }
      }, asio::detached);
  return handle;
}

template <accumulated R>
auto dialog<R>::send(http_request request) const -> dialog<next_result_t<R, http_response>> {
  promise<http_response> response{executor_};
  auto pending = response.get_future();
  auto connection = then_connection(
      [request = std::move(request), response = std::move(response)](connection_ptr conn) -> asio::awaitable<void> {
        detail::issue(*conn, request, response);
        co_return;
      });
  return extend(std::move(connection), then_result(std::move(pending)));
}

template <accumulated R>
auto dialog<R>::send(std::vector<http_request> requests) const -> dialog<response_sequence> {
  std::vector<promise<http_response>> responses;
  std::vector<future<http_response>> pending;
  responses.reserve(requests.size());
  pending.reserve(requests.size());
  for (std::size_t i = 0; i < requests.size(); ++i) {
    responses.emplace_back(executor_);
    pending.push_back(responses.back().get_future());
  }
  auto connection = then_connection(
      [requests = std::move(requests), responses = std::move(responses)](connection_ptr conn) -> asio::awaitable<void> {
        for (std::size_t i = 0; i < requests.size(); ++i) {
          detail::issue(*conn, requests[i], responses[i]);
        }
        co_return;
      });
  return extend(std::move(connection), then_result(std::move(pending)));
}

template <accumulated R>
auto dialog<R>::send_chunked(http_request request, chunker_fn chunker) const -> dialog<next_result_t<R, http_response>> {
  promise<http_response> response{executor_};
  auto pending = response.get_future();
  auto connection = then_connection(
      [request = std::move(request), chunker = std::move(chunker), response = std::move(response)](connection_ptr conn) -> asio::awaitable<void> {
        co_await detail::issue_chunked(std::move(conn), request, chunker, response);
      });
  return extend(std::move(connection), then_result(std::move(pending)));
}

template <accumulated R>
auto dialog<R>::await_response() const -> dialog<R> {
  auto connection = then_connection([settled = result_](connection_ptr) -> asio::awaitable<void> {
    LOG(DEBUG) << "awaiting response" << ENDL;
    co_await settled.async_settle(asio::use_awaitable);
  });
  return extend(std::move(connection), result_);
}

template <accumulated R>
auto dialog<R>::wait_idle(scheduler::duration idle) const -> dialog<R> {
  auto connection = then_connection([timers = scheduler_, idle, ex = executor_](connection_ptr) -> asio::awaitable<void> {
    co_await detail::idle_for(timers, idle, ex);
  });
  return extend(std::move(connection), result_);
}

template <accumulated R>
auto dialog<R>::end() const -> future<R> {
  promise<R> done{executor_};
  auto handle = done.get_future();
  asio::co_spawn(executor_,
      [result = result_, connection = connection_, established = established_, closed = closed_,
       done = std::move(done)]() mutable -> asio::awaitable<void> {
        R value{};
        std::exception_ptr failure;
        try {
          value = co_await result.async_wait(asio::use_awaitable);
          LOG(DEBUG) << "dialog settled with " << response_count(value) << " responses" << ENDL;
        } catch (...) {
          failure = std::current_exception();
        }
        co_await detail::close_once(connection, established, closed);
        if (failure) {
          done.set_exception(failure);
        } else {
          done.set_value(std::move(value));
        }
      }, asio::detached);
  return handle;
}

}	// end of namespace http_dialog
