#pragma once
#include <cstdint>
#include <string>

namespace http_dialog {

/// Defaults used when a dialog is opened without an explicit port or endpoint id.
/// The INI layout is:
///   [client]
///   endpoint_id = http-client
///   port = 80
///   log_level = info
struct client_config {
  static constexpr auto DEFAULT_ENDPOINT_ID{"http-client"};
  static constexpr std::uint16_t DEFAULT_PORT{80};

  std::string endpoint_id{DEFAULT_ENDPOINT_ID};
  std::uint16_t default_port{DEFAULT_PORT};
  std::string log_level{"info"};

  // Missing keys keep their defaults, throws config_error if the file cannot be read or holds bad values
  static auto load(const std::string& path) -> client_config;
};

}	// end of namespace http_dialog
