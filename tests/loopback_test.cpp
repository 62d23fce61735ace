#include "dialog/dialog.hh"
#include "dialog/scheduler.hh"
#include "loopback/loopback.hh"
#include "test_support.hh"
#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>

namespace http_dialog {
namespace {
using namespace std::chrono_literals;
using test_support::drain;
using test_support::settled_value;

class loopback_test : public ::testing::Test {
protected:
  void SetUp() override {
    registry.bind("echo", echo_handler());
  }

  asio::io_context ctx;
  loopback_registry registry{ctx.get_executor()};
};

TEST_F(loopback_test, full_dialog_against_echo_endpoint) {
  auto result = open_dialog(ctx.get_executor(), registry, "localhost", 8080, "echo")
      .send(http_request::get("/first"))
      .reply([](const http_response& r) {
        return http_request::post("/second", r.body());
      })
      .await_response()
      .wait_idle(5ms)
      .send_chunked(http_request{"PUT", "/third", {}, "a"}, [](std::shared_ptr<chunked_requester> requester) {
        requester->send_chunk("b");
        requester->send_chunk("c");
        return requester->close_stream();
      })
      .end();
  ctx.run_for(2s);

  const auto responses = settled_value(ctx, result);
  ASSERT_EQ(responses.size(), 3u);
  EXPECT_EQ(responses[0].body(), "GET /first");
  EXPECT_EQ(responses[1].body(), "POST /second\nGET /first");
  EXPECT_EQ(responses[2].body(), "PUT /third\nabc");

  const auto connections = registry.connections();
  ASSERT_EQ(connections.size(), 1u);
  const auto conn = connections.front();
  EXPECT_EQ(conn->endpoint(), "localhost:8080");
  EXPECT_EQ(conn->close_count(), 1u);
  const auto requests = conn->requests();
  ASSERT_EQ(requests.size(), 3u);
  EXPECT_EQ(requests[0].target(), "/first");
  EXPECT_EQ(requests[1].target(), "/second");
  EXPECT_EQ(requests[2].body(), "abc");
}

TEST_F(loopback_test, config_supplies_port_and_endpoint) {
  client_config config;
  config.endpoint_id = "echo";
  config.default_port = 8443;
  auto result = open_dialog(ctx.get_executor(), registry, "example.org", config)
      .send(http_request::get("/"))
      .end();
  ctx.run_for(2s);
  EXPECT_EQ(settled_value(ctx, result).status(), 200);
  EXPECT_EQ(registry.connections().front()->endpoint(), "example.org:8443");
}

TEST_F(loopback_test, unbound_endpoint_is_refused) {
  auto result = open_dialog(ctx.get_executor(), registry, "localhost", 80, "nobody")
      .send(http_request::get("/"))
      .end();
  ctx.run_for(2s);
  EXPECT_THROW(settled_value(ctx, result), connection_error);
  EXPECT_TRUE(registry.connections().empty());
}

TEST_F(loopback_test, handler_failure_fails_the_response) {
  registry.bind("broken", [](const http_request&) -> http_response {
    throw std::runtime_error("handler exploded");
  });
  auto result = open_dialog(ctx.get_executor(), registry, "localhost", 80, "broken")
      .send(http_request::get("/"))
      .end();
  ctx.run_for(2s);
  EXPECT_THROW(settled_value(ctx, result), std::runtime_error);
  EXPECT_EQ(registry.connections().front()->close_count(), 1u);
}

TEST_F(loopback_test, closed_connection_refuses_requests) {
  loopback_connection conn{ctx.get_executor(), echo_handler(), "local"};
  conn.close();
  EXPECT_TRUE(conn.is_closed());
  EXPECT_THROW(settled_value(ctx, conn.send(http_request::get("/late"))), connection_error);
  EXPECT_TRUE(conn.requests().empty());
}

TEST_F(loopback_test, responses_come_back_in_issue_order) {
  auto conn = std::make_shared<loopback_connection>(ctx.get_executor(), echo_handler(), "local");
  std::vector<std::string> order;
  for (const auto* target : {"/1", "/2", "/3"}) {
    conn->send(http_request::get(target)).async_wait([&order](std::exception_ptr, http_response r) {
      order.push_back(r.body());
    });
  }
  drain(ctx);
  EXPECT_EQ(order, (std::vector<std::string>{"GET /1", "GET /2", "GET /3"}));
}

TEST_F(loopback_test, echo_keeps_the_content_type_of_the_request) {
  auto conn = std::make_shared<loopback_connection>(ctx.get_executor(), echo_handler(), "local");
  const auto json = settled_value(ctx, conn->send(http_request{"POST", "/doc", {{"content-type", "application/json"}}, "{}"}));
  EXPECT_EQ(header_value(json.headers(), "Content-Type"), "application/json");
  EXPECT_EQ(header_value(json.headers(), "CONTENT-LENGTH"), "12");

  const auto plain = settled_value(ctx, conn->send(http_request::get("/")));
  EXPECT_EQ(header_value(plain.headers(), "content-type"), "text/plain");
  EXPECT_TRUE(header_value(plain.headers(), "X-Missing").empty());
}

TEST_F(loopback_test, chunked_stream_cannot_be_used_after_close) {
  auto conn = std::make_shared<loopback_connection>(ctx.get_executor(), echo_handler(), "local");
  auto requester = conn->start_chunked_request(http_request{"PUT", "/up"});
  requester->send_chunk("x");
  EXPECT_EQ(settled_value(ctx, requester->close_stream()).body(), "PUT /up\nx");
  EXPECT_THROW(requester->send_chunk("y"), connection_error);
  EXPECT_THROW(requester->close_stream(), connection_error);
}

TEST(asio_scheduler, fires_once_after_the_delay) {
  asio::io_context ctx;
  asio_scheduler timers{ctx.get_executor()};
  int fired{0};
  const auto started = std::chrono::steady_clock::now();
  std::chrono::steady_clock::duration waited{};
  timers.schedule_once(20ms, [&fired, &waited, started]() {
    ++fired;
    waited = std::chrono::steady_clock::now() - started;
  });
  EXPECT_EQ(fired, 0);
  ctx.run();
  EXPECT_EQ(fired, 1);
  EXPECT_GE(waited, 20ms);
}

}		// end of local namespace
}	// end of namespace http_dialog
