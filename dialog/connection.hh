#pragma once
#include "async/future.hh"
#include "message/http_message.hh"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace http_dialog {

// Emits the body of a request that was started with connection::start_chunked_request.
// If the starting request carried a body, that body already went out as the first chunk.
class chunked_requester {
public:
  virtual ~chunked_requester() = default;

  virtual auto send_chunk(std::string chunk) -> void = 0;
  // terminates the body, the returned future resolves with the response to the whole request
  virtual auto close_stream() -> future<http_response> = 0;
};

// One persistent connection to a remote endpoint.
// send() must have queued the request for the wire when it returns, so that consecutive
// calls go out in call order; the responses are expected back in the same order.
class connection {
public:
  virtual ~connection() = default;

  virtual auto send(const http_request& request) -> future<http_response> = 0;
  virtual auto start_chunked_request(const http_request& request) -> std::shared_ptr<chunked_requester> = 0;
  virtual auto close() -> void = 0;
};

using connection_ptr = std::shared_ptr<connection>;

// Looks up (or opens) the connection for host:port on behalf of the client registered as `endpoint_id`
class endpoint_registry {
public:
  virtual ~endpoint_registry() = default;

  virtual auto connect(const std::string& host, std::uint16_t port, const std::string& endpoint_id) -> future<connection_ptr> = 0;
};

class scheduler {
public:
  using duration = std::chrono::steady_clock::duration;

  virtual ~scheduler() = default;

  virtual auto schedule_once(duration delay, std::function<void()> callback) -> void = 0;
};

}	// end of namespace http_dialog
