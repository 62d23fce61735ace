#include "message/http_message.hh"
#include <boost/algorithm/string.hpp>
#include <ostream>

namespace http_dialog {

http_request::http_request(std::string method, std::string target, header_list headers, std::string body) :
    method_{std::move(method)}, target_{std::move(target)}, headers_{std::move(headers)}, body_{std::move(body)} {
}

auto http_request::get(std::string target) -> http_request {
  return http_request{"GET", std::move(target)};
}

auto http_request::post(std::string target, std::string body) -> http_request {
  const auto len{std::to_string(body.size())};
  return http_request{"POST", std::move(target), {{"Content-Length", len}}, std::move(body)};
}

http_response::http_response(int status, header_list headers, std::string body) :
    status_{status}, headers_{std::move(headers)}, body_{std::move(body)} {
}

auto header_value(const header_list& headers, const std::string& name) -> std::string {
  for (const auto& [n, v] : headers) {
    if (boost::algorithm::iequals(n, name)) {
      return v;
    }
  }
  return {};
}

auto operator<<(std::ostream& os, const http_request& request) -> std::ostream& {
  os << request.method() << " " << request.target();
  if (!request.body().empty()) {
    os << " (" << request.body().size() << " bytes)";
  }
  return os;
}

auto operator<<(std::ostream& os, const http_response& response) -> std::ostream& {
  os << "HTTP " << response.status();
  if (!response.body().empty()) {
    os << " (" << response.body().size() << " bytes)";
  }
  return os;
}

}	// end of namespace http_dialog
