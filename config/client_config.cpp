#include "config/client_config.hh"
#include "errors.hh"
#include "log/logging.hh"
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace http_dialog {
namespace {
namespace pt = boost::property_tree;
}		// end of local namespace

auto client_config::load(const std::string& path) -> client_config {
  pt::ptree tree;
  try {
    pt::read_ini(path, tree);
  } catch (const pt::ini_parser_error& e) {
    throw config_error("failed to read configuration '" + path + "': " + e.message());
  }

  client_config config;
  config.endpoint_id = tree.get<std::string>("client.endpoint_id", config.endpoint_id);
  if (config.endpoint_id.empty()) {
    throw config_error("client.endpoint_id must not be empty in '" + path + "'");
  }

  int port{0};
  try {
    port = tree.get<int>("client.port", config.default_port);
  } catch (const pt::ptree_bad_data&) {
    throw config_error("client.port is not a number in '" + path + "'");
  }
  if (port <= 0 || port > 65535) {
    throw config_error("client.port " + std::to_string(port) + " is out of range in '" + path + "'");
  }
  config.default_port = static_cast<std::uint16_t>(port);

  config.log_level = tree.get<std::string>("client.log_level", config.log_level);
  // unknown level names fail here rather than at logging::init
  logging::parse_level(config.log_level);

  LOG(DEBUG) << "loaded configuration from " << path << ": endpoint " << config.endpoint_id
      << ", port " << config.default_port << ", log level " << config.log_level << ENDL;
  return config;
}

}	// end of namespace http_dialog
