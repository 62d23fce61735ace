#pragma once
#include <stdexcept>
#include <string>

namespace http_dialog {

struct error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// A connection refused or lost the exchange
struct connection_error : error {
  using error::error;
};

struct config_error : error {
  using error::error;
};

// The producing side went away without ever completing the value
struct broken_promise : error {
  broken_promise() : error("promise destroyed before it was completed") {}
};

}	// end of namespace http_dialog
