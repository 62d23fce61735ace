#pragma once
#include "dialog/connection.hh"
#include "network_fwd.hh"
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace http_dialog {

using request_handler = std::function<http_response(const http_request&)>;

// answers 200 with "<method> <target>" followed by the request body, keeping the request's Content-Type
auto echo_handler() -> request_handler;

class loopback_chunked_requester;

/// In-process connection: every request is answered by `handler`, run on the executor in issue order.
/// Nothing goes over a socket.
class loopback_connection final : public connection, public std::enable_shared_from_this<loopback_connection> {
public:
  loopback_connection(executor_type ex, request_handler handler, std::string endpoint);

  auto send(const http_request& request) -> future<http_response> override;
  auto start_chunked_request(const http_request& request) -> std::shared_ptr<chunked_requester> override;
  auto close() -> void override;

  auto requests() const -> std::vector<http_request>;
  auto is_closed() const -> bool;
  auto close_count() const -> std::size_t;
  auto endpoint() const -> const std::string& { return endpoint_; }

private:
  friend class loopback_chunked_requester;

  auto answer(http_request request) -> future<http_response>;

  executor_type executor_;
  request_handler handler_;
  std::string endpoint_;
  mutable std::mutex mutex_;
  std::vector<http_request> requests_;
  std::size_t close_count_{0};
};

/// Hands out loopback connections for the endpoint ids bound to a handler
class loopback_registry final : public endpoint_registry {
public:
  explicit loopback_registry(executor_type ex);

  auto bind(const std::string& endpoint_id, request_handler handler) -> void;

  auto connect(const std::string& host, std::uint16_t port, const std::string& endpoint_id) -> future<connection_ptr> override;

  // every connection handed out so far, oldest first
  auto connections() const -> std::vector<std::shared_ptr<loopback_connection>>;

private:
  executor_type executor_;
  mutable std::mutex mutex_;
  std::map<std::string, request_handler> handlers_;
  std::vector<std::shared_ptr<loopback_connection>> connections_;
};

}	// end of namespace http_dialog
