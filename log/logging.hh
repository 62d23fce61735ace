#pragma once
#include <boost/log/trivial.hpp>
#include <ostream>
#include <string_view>

#define LOG_SEVERITY_TRACE ::boost::log::trivial::trace
#define LOG_SEVERITY_DEBUG ::boost::log::trivial::debug
#define LOG_SEVERITY_INFO ::boost::log::trivial::info
#define LOG_SEVERITY_WARNING ::boost::log::trivial::warning
#define LOG_SEVERITY_ERROR ::boost::log::trivial::error
#define LOG_SEVERITY_FATAL ::boost::log::trivial::fatal

// usage: LOG(INFO) << "connected to " << host << ENDL;
#define LOG(severity) BOOST_LOG_SEV(::boost::log::trivial::logger::get(), LOG_SEVERITY_##severity)
#define ENDL std::flush

namespace http_dialog::logging {

using level = boost::log::trivial::severity_level;

/// Map a configuration name ("debug", "info", "warning"...) to a level, throws config_error for unknown names
auto parse_level(std::string_view name) -> level;

/// Install the console sink and drop every record below `min`. Safe to call more than once
auto init(level min) -> void;

}	// end of namespace http_dialog::logging
