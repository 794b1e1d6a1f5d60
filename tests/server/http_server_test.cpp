/**
 * @file http_server_test.cpp
 * @brief HttpServer lifecycle, health, error bodies and CORS
 */

#include "server/http_server.h"

#include <gtest/gtest.h>

#include "gateway_test_fixture.h"

namespace monitorgate::server {
namespace {

using json = nlohmann::json;
using testing::GatewayTest;
using testing::MockAlertsSource;
using testing::MockMetricsSource;

TEST_F(GatewayTest, StartStop) {
  StartServer();
  EXPECT_TRUE(server_->IsRunning());
  EXPECT_GT(server_->GetPort(), 0);

  server_->Stop();
  EXPECT_FALSE(server_->IsRunning());

  // Stopping twice is harmless
  server_->Stop();
  EXPECT_FALSE(server_->IsRunning());
}

TEST_F(GatewayTest, StartTwiceFails) {
  StartServer();
  auto second = server_->Start();
  ASSERT_FALSE(second);
  EXPECT_EQ(second.error().code(), utils::ErrorCode::kNetworkAlreadyRunning);
  EXPECT_TRUE(server_->IsRunning());
}

TEST(HttpServerBindTest, InvalidBindAddressFails) {
  ::testing::NiceMock<MockMetricsSource> metrics;
  ::testing::NiceMock<MockAlertsSource> alerts;
  HttpServerConfig config;
  config.bind = "256.256.256.256";
  config.port = 0;

  HttpServer server(config, metrics, alerts);
  auto result = server.Start();
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), utils::ErrorCode::kNetworkBindFailed);
  EXPECT_NE(result.error().message().find("Failed to bind to 256.256.256.256"), std::string::npos);
  EXPECT_FALSE(server.IsRunning());
}

TEST_F(GatewayTest, HealthReportsStatusAndEnvironment) {
  StartServer();
  auto res = client_->Get("/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_NE(res->get_header_value("Content-Type").find("application/json"), std::string::npos);

  json body = Body(res);
  EXPECT_EQ(body["status"], "ok");
  EXPECT_EQ(body["environment"], "test");
  ASSERT_TRUE(body["timestamp"].is_string());
  EXPECT_EQ(body["timestamp"].get<std::string>().size(), 24U);
  EXPECT_FALSE(body.contains("success"));
}

TEST_F(GatewayTest, UnknownRouteAnswersJsonNotFound) {
  StartServer();
  auto res = client_->Get("/api/unknown");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 404);
  EXPECT_EQ(Body(res), (json{{"success", false}, {"error", "Not found"}}));
}

TEST_F(GatewayTest, CorsAnyOriginByDefault) {
  StartServer();
  auto res = client_->Get("/health", httplib::Headers{{"Origin", "http://dashboard.example"}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
  EXPECT_EQ(res->get_header_value("Access-Control-Allow-Credentials"), "true");
  EXPECT_FALSE(res->has_header("Vary"));
}

TEST_F(GatewayTest, CorsEchoesListedOrigin) {
  config_.cors_allow_origins = {"http://localhost:3000", "http://dashboard.example"};
  StartServer();

  auto res = client_->Get("/health", httplib::Headers{{"Origin", "http://dashboard.example"}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "http://dashboard.example");
  EXPECT_EQ(res->get_header_value("Vary"), "Origin");
}

TEST_F(GatewayTest, CorsOmitsHeadersForUnlistedOrigin) {
  config_.cors_allow_origins = {"http://localhost:3000"};
  StartServer();

  auto res = client_->Get("/health", httplib::Headers{{"Origin", "http://evil.example"}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_FALSE(res->has_header("Access-Control-Allow-Origin"));
}

TEST_F(GatewayTest, CorsPreflight) {
  StartServer();
  auto res = client_->Options("/api/alertmanager/silences", httplib::Headers{{"Origin", "http://dashboard.example"},
                                                              {"Access-Control-Request-Method", "POST"},
                                                              {"Access-Control-Request-Headers", "X-Custom"}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 204);
  EXPECT_EQ(res->get_header_value("Access-Control-Allow-Methods"), "GET,HEAD,PUT,PATCH,POST,DELETE");
  EXPECT_EQ(res->get_header_value("Access-Control-Allow-Headers"), "X-Custom");
  EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
}

TEST_F(GatewayTest, CorsDisabled) {
  config_.enable_cors = false;
  StartServer();

  auto res = client_->Get("/health", httplib::Headers{{"Origin", "http://dashboard.example"}});
  ASSERT_TRUE(res);
  EXPECT_FALSE(res->has_header("Access-Control-Allow-Origin"));
}

TEST(HttpServerCorsTest, ResolveAllowOrigin) {
  EXPECT_EQ(HttpServer::ResolveAllowOrigin({}, ""), "*");
  EXPECT_EQ(HttpServer::ResolveAllowOrigin({}, "http://a.example"), "*");

  std::vector<std::string> allowed = {"http://a.example"};
  EXPECT_EQ(HttpServer::ResolveAllowOrigin(allowed, "http://a.example"), "http://a.example");
  EXPECT_EQ(HttpServer::ResolveAllowOrigin(allowed, "http://b.example"), "");
  EXPECT_EQ(HttpServer::ResolveAllowOrigin(allowed, ""), "");
}

}  // namespace
}  // namespace monitorgate::server
