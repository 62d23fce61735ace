#include "log/logging.hh"
#include "errors.hh"
#include <boost/algorithm/string.hpp>
#include <boost/log/core.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/keywords/format.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <array>
#include <atomic>
#include <iostream>
#include <string>
#include <utility>

namespace http_dialog::logging {
namespace {
namespace blog = boost::log;
namespace expr = boost::log::expressions;

static constexpr std::array<std::pair<std::string_view, level>, 7> LEVEL_NAMES{{
  {"trace", level::trace},
  {"debug", level::debug},
  {"info", level::info},
  {"warning", level::warning},
  {"warn", level::warning},
  {"error", level::error},
  {"fatal", level::fatal}
}};

std::atomic_bool sink_installed{false};

}		// end of local namespace

auto parse_level(std::string_view name) -> level {
  const std::string trimmed{boost::algorithm::trim_copy(std::string{name})};
  for (const auto& [n, l] : LEVEL_NAMES) {
    if (boost::algorithm::iequals(n, trimmed)) {
      return l;
    }
  }
  throw config_error("unknown log level '" + trimmed + "'");
}

auto init(level min) -> void {
  if (!sink_installed.exchange(true)) {
    blog::add_common_attributes();
    blog::add_console_log(std::clog,
        blog::keywords::format = (
          expr::stream
            << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%H:%M:%S.%f")
            << " [" << blog::trivial::severity << "] "
            << expr::smessage
        )
    );
  }
  blog::core::get()->set_filter(blog::trivial::severity >= min);
}

}	// end of namespace http_dialog::logging
