#include "config/client_config.hh"
#include "dialog/dialog.hh"
#include "log/logging.hh"
#include "loopback/loopback.hh"
#include <chrono>
#include <exception>
#include <iostream>
#include <string>

namespace {
using namespace http_dialog;
using namespace std::chrono_literals;

auto print_responses(const response_sequence& responses) -> void {
  std::size_t i{0};
  for (const auto& r : responses) {
    std::cout << "#" << ++i << " " << r << "\n" << r.body() << "\n--------------------------\n";
  }
}

auto parse_port(const std::string& arg) -> std::uint16_t {
  const auto port{std::stoi(arg)};
  if (port <= 0 || port > 65535) {
    throw config_error("port " + arg + " is out of range");
  }
  return static_cast<std::uint16_t>(port);
}

}		// end of local namespace

int main(int argc, char* argv[]) {
  if (argc != 4 && argc != 5) {
    std::cout << "Usage: http_dialog_demo <server> <port> <path> [config.ini]\n";
    std::cout << "Example:\n";
    std::cout << "  http_dialog_demo www.boost.org 8080 /LICENSE_1_0.txt\n";
    return 1;
  }

  try {
    const auto config{argc == 5 ? client_config::load(argv[4]) : client_config{}};
    logging::init(logging::parse_level(config.log_level));

    asio::io_context io_context;
    // the demo talks to an in-process endpoint that echoes every request back
    loopback_registry registry{io_context.get_executor()};
    registry.bind(config.endpoint_id, echo_handler());

    const std::string resource{argv[3]};
    auto result = open_dialog(io_context.get_executor(), registry, argv[1], parse_port(argv[2]), config.endpoint_id)
        .send(http_request::get(resource))
        .reply([&resource](const http_response& first) {
          return http_request::post(resource, first.body());
        })
        .await_response()
        .wait_idle(50ms)
        .send_chunked(http_request{"PUT", resource, {{"Transfer-Encoding", "chunked"}}, "first chunk;"},
            [](std::shared_ptr<chunked_requester> requester) {
              requester->send_chunk("second chunk;");
              requester->send_chunk("last chunk");
              return requester->close_stream();
            })
        .end();

    int rc{0};
    result.async_wait([&rc](std::exception_ptr e, response_sequence responses) {
      if (e) {
        try {
          std::rethrow_exception(e);
        } catch (const std::exception& ex) {
          LOG(ERROR) << "dialog failed: " << ex.what() << ENDL;
        }
        rc = -1;
        return;
      }
      std::cout << "dialog finished with " << responses.size() << " responses:\n";
      print_responses(responses);
    });
    io_context.run();
    return rc;
  } catch (std::exception& e) {
    std::cerr << "Exception: " << e.what() << "\n";
  }

  return -1;
}
