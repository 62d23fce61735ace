#include "loopback/loopback.hh"
#include "errors.hh"
#include "log/logging.hh"
#include <utility>

namespace http_dialog {

auto echo_handler() -> request_handler {
  return [](const http_request& request) {
    std::string body{request.method() + " " + request.target()};
    if (!request.body().empty()) {
      body += "\n" + request.body();
    }
    auto content_type = header_value(request.headers(), "Content-Type");
    if (content_type.empty()) {
      content_type = "text/plain";
    }
    return http_response{200, {{"Content-Type", std::move(content_type)}, {"Content-Length", std::to_string(body.size())}},
                         std::move(body)};
  };
}

class loopback_chunked_requester final : public chunked_requester {
public:
  loopback_chunked_requester(std::shared_ptr<loopback_connection> owner, http_request start) :
      owner_{std::move(owner)}, start_{std::move(start)}, body_{start_.body()} {
  }

  auto send_chunk(std::string chunk) -> void override {
    if (closed_) {
      throw connection_error("chunk sent after the stream of " + start_.target() + " was closed");
    }
    LOG(DEBUG) << "loopback chunk of " << chunk.size() << " bytes for " << start_.target() << ENDL;
    body_ += chunk;
  }

  auto close_stream() -> future<http_response> override {
    if (closed_) {
      throw connection_error("stream of " + start_.target() + " closed twice");
    }
    closed_ = true;
    return owner_->answer(http_request{start_.method(), start_.target(), start_.headers(), std::move(body_)});
  }

private:
  std::shared_ptr<loopback_connection> owner_;
  http_request start_;
  std::string body_;
  bool closed_{false};
};

loopback_connection::loopback_connection(executor_type ex, request_handler handler, std::string endpoint) :
    executor_{std::move(ex)}, handler_{std::move(handler)}, endpoint_{std::move(endpoint)} {
}

auto loopback_connection::send(const http_request& request) -> future<http_response> {
  return answer(request);
}

auto loopback_connection::start_chunked_request(const http_request& request) -> std::shared_ptr<chunked_requester> {
  if (is_closed()) {
    throw connection_error("chunked request " + request.target() + " on closed connection to " + endpoint_);
  }
  return std::make_shared<loopback_chunked_requester>(shared_from_this(), request);
}

auto loopback_connection::close() -> void {
  std::lock_guard lock{mutex_};
  ++close_count_;
  LOG(DEBUG) << "loopback connection to " << endpoint_ << " closed" << ENDL;
}

auto loopback_connection::requests() const -> std::vector<http_request> {
  std::lock_guard lock{mutex_};
  return requests_;
}

auto loopback_connection::is_closed() const -> bool {
  std::lock_guard lock{mutex_};
  return close_count_ > 0;
}

auto loopback_connection::close_count() const -> std::size_t {
  std::lock_guard lock{mutex_};
  return close_count_;
}

auto loopback_connection::answer(http_request request) -> future<http_response> {
  {
    std::lock_guard lock{mutex_};
    if (close_count_ > 0) {
      LOG(WARNING) << "trying to send " << request << " on closed connection to " << endpoint_ << ENDL;
      return make_failed_future<http_response>(executor_,
          std::make_exception_ptr(connection_error("connection to " + endpoint_ + " is closed")));
    }
    requests_.push_back(request);
  }
  promise<http_response> response{executor_};
  auto answered = response.get_future();
  // posts run in order, so responses come back in issue order
  asio::post(executor_, [handler = handler_, request = std::move(request), response = std::move(response)]() mutable {
    try {
      response.set_value(handler(request));
    } catch (...) {
      response.set_exception(std::current_exception());
    }
  });
  return answered;
}

loopback_registry::loopback_registry(executor_type ex) : executor_{std::move(ex)} {
}

auto loopback_registry::bind(const std::string& endpoint_id, request_handler handler) -> void {
  std::lock_guard lock{mutex_};
  handlers_[endpoint_id] = std::move(handler);
}

auto loopback_registry::connect(const std::string& host, std::uint16_t port, const std::string& endpoint_id) -> future<connection_ptr> {
  promise<connection_ptr> connected{executor_};
  auto handle = connected.get_future();
  std::lock_guard lock{mutex_};
  auto i = handlers_.find(endpoint_id);
  if (i == handlers_.end()) {
    LOG(ERROR) << "no loopback endpoint bound as '" << endpoint_id << "' for " << host << ":" << port << ENDL;
    connected.set_exception(std::make_exception_ptr(connection_error("endpoint '" + endpoint_id + "' is not bound")));
    return handle;
  }
  auto conn = std::make_shared<loopback_connection>(executor_, i->second, host + ":" + std::to_string(port));
  connections_.push_back(conn);
  LOG(INFO) << "connecting to " << conn->endpoint() << " through " << endpoint_id << ENDL;
  asio::post(executor_, [conn, connected = std::move(connected)]() mutable {
    connected.set_value(std::move(conn));
  });
  return handle;
}

auto loopback_registry::connections() const -> std::vector<std::shared_ptr<loopback_connection>> {
  std::lock_guard lock{mutex_};
  return connections_;
}

}	// end of namespace http_dialog
