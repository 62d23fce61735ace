#include "dialog/dialog.hh"
#include "dialog/scheduler.hh"
#include "log/logging.hh"
#include <boost/asio/this_coro.hpp>
#include <chrono>
#include <string>

namespace http_dialog {
namespace detail {
namespace {

// Hands the chunker its requester and reports when the body is complete, that is when
// close_stream() was called or the chunker let go of the stream without closing it.
class streaming_requester final : public chunked_requester {
public:
  streaming_requester(executor_type ex, std::shared_ptr<chunked_requester> stream, std::string target,
                      promise<http_response> response) :
      stream_{std::move(stream)}, target_{std::move(target)}, response_{std::move(response)},
      streamed_{std::move(ex)} {
  }

  ~streaming_requester() override {
    if (!closed_) {
      LOG(WARNING) << "chunked request " << target_ << " was dropped before its body was closed" << ENDL;
      response_.set_exception(std::make_exception_ptr(
          error("body of chunked request " + target_ + " was never closed")));
      streamed_.set_value(true);
    }
  }

  auto send_chunk(std::string chunk) -> void override {
    stream_->send_chunk(std::move(chunk));
  }

  auto close_stream() -> future<http_response> override {
    closed_ = true;
    try {
      auto answered = stream_->close_stream();
      streamed_.set_value(true);
      return answered;
    } catch (...) {
      streamed_.set_value(true);
      throw;
    }
  }

  auto streamed() const -> future<bool> { return streamed_.get_future(); }

private:
  std::shared_ptr<chunked_requester> stream_;
  std::string target_;
  promise<http_response> response_;
  promise<bool> streamed_;
  bool closed_{false};
};

auto describe(std::exception_ptr failure) -> std::string {
  try {
    std::rethrow_exception(failure);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown failure";
  }
}

}		// end of local namespace

auto arrive(future<http_response> pending) -> asio::awaitable<http_response> {
  co_return co_await pending.async_wait(asio::use_awaitable);
}

auto arrive(std::vector<future<http_response>> pending) -> asio::awaitable<response_sequence> {
  response_sequence batch;
  batch.reserve(pending.size());
  for (const auto& p : pending) {
    batch.push_back(co_await p.async_wait(asio::use_awaitable));
  }
  co_return batch;
}

auto issue(connection& conn, const http_request& request, promise<http_response> response) -> void {
  LOG(DEBUG) << "sending request " << request << ENDL;
  try {
    forward_result(conn.send(request), response);
  } catch (...) {
    // a connection refusing the request fails this response only
    response.set_exception(std::current_exception());
  }
}

auto issue_chunked(connection_ptr conn, http_request request, chunker_fn chunker,
                   promise<http_response> response) -> asio::awaitable<void> {
  LOG(DEBUG) << "sending chunked request start " << request << ENDL;
  auto ex = co_await asio::this_coro::executor;
  std::shared_ptr<streaming_requester> stream;
  try {
    stream = std::make_shared<streaming_requester>(std::move(ex), conn->start_chunked_request(request),
                                                   request.target(), response);
  } catch (...) {
    response.set_exception(std::current_exception());
    co_return;
  }
  auto streamed = stream->streamed();
  try {
    auto answered = chunker(stream);
    if (!answered.valid()) {
      throw error("chunker for " + request.target() + " returned no response");
    }
    forward_result(answered, response);
  } catch (...) {
    response.set_exception(std::current_exception());
  }
  // from here on only the chunker keeps the stream alive
  stream.reset();
  co_await streamed.async_settle(asio::use_awaitable);
}

auto issue_reply(connection_ptr conn, future<http_response> answered, reply_fn f,
                 promise<http_response> response) -> asio::awaitable<void> {
  try {
    auto previous = co_await answered.async_wait(asio::use_awaitable);
    auto request = f(previous);
    LOG(DEBUG) << "replying to " << previous << ENDL;
    issue(*conn, request, response);
  } catch (...) {
    response.set_exception(std::current_exception());
  }
}

auto idle_for(std::shared_ptr<scheduler> timers, scheduler::duration idle, executor_type ex) -> asio::awaitable<void> {
  LOG(DEBUG) << "waiting " << std::chrono::duration_cast<std::chrono::milliseconds>(idle).count() << " ms" << ENDL;
  promise<bool> elapsed{std::move(ex)};
  auto fired = elapsed.get_future();
  timers->schedule_once(idle, [elapsed = std::move(elapsed)]() mutable {
    elapsed.set_value(true);
  });
  co_await fired.async_wait(asio::use_awaitable);
}

auto close_once(future<connection_ptr> connection, future<connection_ptr> established,
                std::shared_ptr<std::atomic_bool> closed) -> asio::awaitable<void> {
  connection_ptr conn;
  try {
    conn = co_await connection.async_wait(asio::use_awaitable);
  } catch (...) {
    LOG(DEBUG) << "dialog broke off before its last step (" << describe(std::current_exception())
               << "), closing the connection it started with" << ENDL;
  }
  if (!conn) {
    try {
      conn = co_await established.async_wait(asio::use_awaitable);
    } catch (...) {
      LOG(WARNING) << "dialog connection is not available, nothing to close: " << describe(std::current_exception()) << ENDL;
      co_return;
    }
  }
  if (closed->exchange(true)) {
    LOG(WARNING) << "dialog connection was already closed by an earlier end()" << ENDL;
    co_return;
  }
  LOG(DEBUG) << "closing connection after dialog completion" << ENDL;
  try {
    conn->close();
  } catch (...) {
    LOG(WARNING) << "failed to close dialog connection: " << describe(std::current_exception()) << ENDL;
  }
}

}	// end of namespace detail

auto open_dialog(executor_type ex, std::shared_ptr<scheduler> timers, endpoint_registry& registry,
                 const std::string& host, std::uint16_t port, const std::string& endpoint_id) -> dialog<empty_result> {
  LOG(DEBUG) << "opening dialog with " << host << ":" << port << " through " << endpoint_id << ENDL;
  future<connection_ptr> connection;
  try {
    connection = registry.connect(host, port, endpoint_id);
  } catch (...) {
    connection = make_failed_future<connection_ptr>(ex, std::current_exception());
  }

  // the result starts out empty once the connection is there, and fails with it
  promise<empty_result> started{ex};
  auto result = started.get_future();
  connection.async_wait([started = std::move(started)](std::exception_ptr e, connection_ptr) mutable {
    if (e) {
      started.set_exception(e);
    } else {
      started.set_value(empty_result{});
    }
  });
  auto established = connection;
  return dialog<empty_result>{std::move(ex), std::move(timers), std::move(connection), std::move(established),
                              std::move(result), std::make_shared<std::atomic_bool>(false)};
}

auto open_dialog(executor_type ex, endpoint_registry& registry, const std::string& host,
                 std::uint16_t port, const std::string& endpoint_id) -> dialog<empty_result> {
  auto timers = std::make_shared<asio_scheduler>(ex);
  return open_dialog(std::move(ex), std::move(timers), registry, host, port, endpoint_id);
}

auto open_dialog(executor_type ex, endpoint_registry& registry, const std::string& host,
                 const client_config& config) -> dialog<empty_result> {
  return open_dialog(std::move(ex), registry, host, config.default_port, config.endpoint_id);
}

}	// end of namespace http_dialog
