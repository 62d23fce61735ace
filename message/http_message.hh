#pragma once
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace http_dialog {

// ordered, a name may appear more than once
using header_list = std::vector<std::pair<std::string, std::string>>;

class http_request {
public:
  http_request() = default;
  http_request(std::string method, std::string target, header_list headers = {}, std::string body = {});

  static auto get(std::string target) -> http_request;
  static auto post(std::string target, std::string body) -> http_request;

  auto method() const -> const std::string& { return method_; }
  auto target() const -> const std::string& { return target_; }
  auto headers() const -> const header_list& { return headers_; }
  auto body() const -> const std::string& { return body_; }

  auto operator==(const http_request&) const -> bool = default;

private:
  std::string method_{"GET"};
  std::string target_{"/"};
  header_list headers_;
  std::string body_;
};

class http_response {
public:
  http_response() = default;
  explicit http_response(int status, header_list headers = {}, std::string body = {});

  auto status() const -> int { return status_; }
  auto headers() const -> const header_list& { return headers_; }
  auto body() const -> const std::string& { return body_; }

  auto operator==(const http_response&) const -> bool = default;

private:
  int status_{200};
  header_list headers_;
  std::string body_;
};

// first value of the header `name`, compared case-insensitively; empty if not present
auto header_value(const header_list& headers, const std::string& name) -> std::string;

auto operator<<(std::ostream& os, const http_request& request) -> std::ostream&;
auto operator<<(std::ostream& os, const http_response& response) -> std::ostream&;

}	// end of namespace http_dialog
