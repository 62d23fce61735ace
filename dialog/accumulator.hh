#pragma once
#include "message/http_message.hh"
#include <concepts>
#include <cstddef>
#include <utility>
#include <vector>

namespace http_dialog {

// The three shapes a dialog result can take. A dialog's result only ever grows:
// empty_result -> http_response -> response_sequence.
struct empty_result {
  auto operator==(const empty_result&) const -> bool = default;
};
using response_sequence = std::vector<http_response>;

template <typename R>
concept accumulated = std::same_as<R, empty_result> || std::same_as<R, http_response> ||
                      std::same_as<R, response_sequence>;

// A single response arriving
inline auto concat(empty_result, http_response response) -> http_response {
  return response;
}

inline auto concat(http_response first, http_response response) -> response_sequence {
  response_sequence all;
  all.reserve(2);
  all.push_back(std::move(first));
  all.push_back(std::move(response));
  return all;
}

inline auto concat(response_sequence all, http_response response) -> response_sequence {
  all.push_back(std::move(response));
  return all;
}

// A pipelined batch arriving, always yields a sequence
inline auto concat(empty_result, response_sequence batch) -> response_sequence {
  return batch;
}

inline auto concat(http_response first, response_sequence batch) -> response_sequence {
  batch.insert(batch.begin(), std::move(first));
  return batch;
}

inline auto concat(response_sequence all, response_sequence batch) -> response_sequence {
  all.insert(all.end(), std::make_move_iterator(batch.begin()), std::make_move_iterator(batch.end()));
  return all;
}

template <accumulated R, typename Arrival>
using next_result_t = decltype(concat(std::declval<R>(), std::declval<Arrival>()));

inline auto response_count(const empty_result&) -> std::size_t {
  return 0;
}

inline auto response_count(const http_response&) -> std::size_t {
  return 1;
}

inline auto response_count(const response_sequence& all) -> std::size_t {
  return all.size();
}

}	// end of namespace http_dialog
