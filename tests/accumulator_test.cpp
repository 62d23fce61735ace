#include "dialog/accumulator.hh"
#include <gtest/gtest.h>
#include <type_traits>

namespace http_dialog {
namespace {

auto response(int status, std::string body) -> http_response {
  return http_response{status, {}, std::move(body)};
}

auto bodies(const response_sequence& all) -> std::vector<std::string> {
  std::vector<std::string> out;
  for (const auto& r : all) {
    out.push_back(r.body());
  }
  return out;
}

static_assert(std::is_same_v<next_result_t<empty_result, http_response>, http_response>);
static_assert(std::is_same_v<next_result_t<http_response, http_response>, response_sequence>);
static_assert(std::is_same_v<next_result_t<response_sequence, http_response>, response_sequence>);
static_assert(std::is_same_v<next_result_t<empty_result, response_sequence>, response_sequence>);
static_assert(std::is_same_v<next_result_t<http_response, response_sequence>, response_sequence>);
static_assert(std::is_same_v<next_result_t<response_sequence, response_sequence>, response_sequence>);

TEST(accumulator, first_response_becomes_single) {
  const auto single = concat(empty_result{}, response(200, "a"));
  EXPECT_EQ(single, response(200, "a"));
}

TEST(accumulator, second_response_becomes_sequence_in_arrival_order) {
  const auto all = concat(response(200, "a"), response(404, "b"));
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].status(), 200);
  EXPECT_EQ(all[1].status(), 404);
}

TEST(accumulator, sequence_grows_at_the_end) {
  const auto all = concat(response_sequence{response(200, "a"), response(200, "b")}, response(200, "c"));
  EXPECT_EQ(bodies(all), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(accumulator, batch_on_empty_is_the_batch) {
  const auto all = concat(empty_result{}, response_sequence{response(200, "a"), response(200, "b")});
  EXPECT_EQ(bodies(all), (std::vector<std::string>{"a", "b"}));
}

TEST(accumulator, batch_follows_single) {
  const auto all = concat(response(200, "a"), response_sequence{response(200, "b"), response(200, "c")});
  EXPECT_EQ(bodies(all), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(accumulator, batch_appends_to_sequence) {
  const auto all = concat(response_sequence{response(200, "a")}, response_sequence{response(200, "b"), response(200, "c")});
  EXPECT_EQ(bodies(all), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(accumulator, empty_batch_still_yields_sequence) {
  const auto all = concat(response(200, "a"), response_sequence{});
  EXPECT_EQ(bodies(all), (std::vector<std::string>{"a"}));
}

TEST(accumulator, response_count_follows_the_shape) {
  EXPECT_EQ(response_count(empty_result{}), 0u);
  EXPECT_EQ(response_count(response(200, "a")), 1u);
  EXPECT_EQ(response_count(response_sequence{}), 0u);
  EXPECT_EQ(response_count(concat(response(200, "a"), response_sequence{response(200, "b"), response(200, "c")})), 3u);
}

}		// end of local namespace
}	// end of namespace http_dialog
