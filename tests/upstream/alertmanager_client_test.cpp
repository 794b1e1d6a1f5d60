/**
 * @file alertmanager_client_test.cpp
 * @brief Tests for the Alertmanager client against an in-process fake Alertmanager
 */

#include "upstream/alertmanager_client.h"

#include <gtest/gtest.h>

#include "fake_http_server.h"

using namespace monitorgate::upstream;
using monitorgate::upstream::testing::FakeHttpServer;
using monitorgate::utils::ErrorCode;
using nlohmann::json;

namespace {

json UpstreamAlert() {
  return json{{"fingerprint", "a1b2c3"},
              {"status", {{"state", "active"}, {"silencedBy", json::array()}}},
              {"labels",
               {{"alertname", "HighCPU"},
                {"severity", "critical"},
                {"cluster", "prod"},
                {"instance", "es-1:9114"},
                {"job", "elasticsearch"}}},
              {"annotations", {{"description", "CPU above 90%"}, {"summary", "High CPU"}}},
              {"startsAt", "2024-01-15T10:00:00Z"},
              {"endsAt", "2024-01-15T11:00:00Z"}};
}

}  // namespace

class AlertmanagerClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto& server = fake_.server();

    server.Get("/api/v2/alerts", [this](const httplib::Request& req, httplib::Response& res) {
      last_filter_ = req.get_param_value("filter");
      res.set_content(json::array({UpstreamAlert(), json{{"labels", {{"alertname", "Bare"}}}}}).dump(),
                      "application/json");
    });
    server.Post("/api/v2/alerts", [this](const httplib::Request& req, httplib::Response& res) {
      posted_ = json::parse(req.body);
      res.status = 200;
    });
    server.Get("/api/v2/alerts/groups", [](const httplib::Request&, httplib::Response& res) {
      res.set_content(R"([{"labels":{"alertname":"HighCPU"},"receiver":{"name":"team"},"alerts":[]}])",
                      "application/json");
    });
    server.Get("/api/v2/silences", [this](const httplib::Request& req, httplib::Response& res) {
      last_filter_ = req.get_param_value("filter");
      res.set_content(R"([{"id":"s-1","status":{"state":"active"},"createdBy":"ops"}])", "application/json");
    });
    server.Post("/api/v2/silences", [this](const httplib::Request& req, httplib::Response& res) {
      posted_ = json::parse(req.body);
      res.set_content(R"({"silenceID":"s-2"})", "application/json");
    });
    server.Get(R"(/api/v2/silence/([^/]+))", [](const httplib::Request& req, httplib::Response& res) {
      if (req.matches[1] != "s-1") {
        res.status = 404;
        res.set_content("\"silence not found\"", "application/json");
        return;
      }
      res.set_content(R"({"id":"s-1","comment":"maintenance"})", "application/json");
    });
    server.Delete(R"(/api/v2/silence/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
      deleted_ = req.matches[1];
      res.status = 200;
    });
    server.Get("/api/v2/receivers", [](const httplib::Request&, httplib::Response& res) {
      res.set_content(R"([{"name":"team-pager"}])", "application/json");
    });
    server.Get("/api/v2/status", [](const httplib::Request&, httplib::Response& res) {
      res.set_content(R"({"cluster":{"status":"ready"},"versionInfo":{"version":"0.26.0"}})", "application/json");
    });
    server.Get("/-/healthy", [](const httplib::Request&, httplib::Response& res) { res.set_content("OK", "text/plain"); });

    ASSERT_TRUE(fake_.Start());
    client_ = std::make_unique<AlertmanagerClient>(HttpClientOptions{fake_.url(), 2000});
  }

  void TearDown() override { fake_.Stop(); }

  FakeHttpServer fake_;
  std::unique_ptr<AlertmanagerClient> client_;
  std::string last_filter_;
  json posted_;
  std::string deleted_;
};

TEST(AlertmanagerMapAlertTest, FlattensUpstreamAlert) {
  json record = AlertmanagerClient::MapAlert(UpstreamAlert());

  EXPECT_EQ(record["id"], "a1b2c3");
  EXPECT_EQ(record["name"], "HighCPU");
  EXPECT_EQ(record["severity"], "critical");
  EXPECT_EQ(record["status"]["state"], "active");
  EXPECT_EQ(record["description"], "CPU above 90%");
  EXPECT_EQ(record["labels"], (json{{"cluster", "prod"}, {"alertname", "HighCPU"}, {"instance", "es-1:9114"}}));
  EXPECT_EQ(record["startsAt"], "2024-01-15T10:00:00Z");
  EXPECT_FALSE(record.contains("endsAt"));
  EXPECT_FALSE(record.contains("annotations"));
}

TEST(AlertmanagerMapAlertTest, AbsentFieldsStayAbsent) {
  json record = AlertmanagerClient::MapAlert(json{{"labels", {{"alertname", "Bare"}}}});

  EXPECT_EQ(record["name"], "Bare");
  EXPECT_FALSE(record.contains("id"));
  EXPECT_FALSE(record.contains("severity"));
  EXPECT_FALSE(record.contains("description"));
  EXPECT_EQ(record["labels"], (json{{"alertname", "Bare"}}));
}

TEST(AlertmanagerMapAlertTest, NonObjectAlert) {
  json record = AlertmanagerClient::MapAlert(json("garbage"));
  EXPECT_EQ(record, (json{{"labels", json::object()}}));
}

TEST_F(AlertmanagerClientTest, GetAlertsMapsEveryAlert) {
  auto result = client_->GetAlerts(std::nullopt);
  ASSERT_TRUE(result) << result.error().to_string();
  ASSERT_EQ(result->size(), 2U);
  EXPECT_EQ((*result)[0]["name"], "HighCPU");
  EXPECT_EQ((*result)[1]["name"], "Bare");
  EXPECT_TRUE(last_filter_.empty());
}

TEST_F(AlertmanagerClientTest, FilterIsForwarded) {
  ASSERT_TRUE(client_->GetAlerts(std::string("alertname=\"HighCPU\"")));
  EXPECT_EQ(last_filter_, "alertname=\"HighCPU\"");

  ASSERT_TRUE(client_->GetSilences(std::string("createdBy=ops")));
  EXPECT_EQ(last_filter_, "createdBy=ops");
}

TEST_F(AlertmanagerClientTest, PostAlertsSendsBody) {
  json alerts = json::array({json{{"labels", {{"alertname", "Manual"}}}}});
  auto result = client_->PostAlerts(alerts);
  ASSERT_TRUE(result) << result.error().to_string();
  EXPECT_EQ(posted_, alerts);
}

TEST_F(AlertmanagerClientTest, AlertGroupsPassThrough) {
  auto result = client_->GetAlertGroups(std::nullopt);
  ASSERT_TRUE(result) << result.error().to_string();
  EXPECT_EQ((*result)[0]["receiver"]["name"], "team");
}

TEST_F(AlertmanagerClientTest, Silences) {
  auto silences = client_->GetSilences(std::nullopt);
  ASSERT_TRUE(silences) << silences.error().to_string();
  EXPECT_EQ((*silences)[0]["id"], "s-1");

  auto silence = client_->GetSilence("s-1");
  ASSERT_TRUE(silence) << silence.error().to_string();
  EXPECT_EQ((*silence)["comment"], "maintenance");
}

TEST_F(AlertmanagerClientTest, UnknownSilenceIsNotFound) {
  auto result = client_->GetSilence("nope");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kUpstreamNotFound);
  EXPECT_EQ(result.error().message().rfind("Failed to fetch silence: ", 0), 0U);
  EXPECT_NE(result.error().message().find("silence not found"), std::string::npos);
}

TEST_F(AlertmanagerClientTest, CreateSilenceReturnsUpstreamBody) {
  json silence = {{"matchers", json::array({json{{"name", "alertname"}, {"value", "HighCPU"}, {"isRegex", false}}})},
                  {"startsAt", "2024-01-15T10:00:00Z"},
                  {"endsAt", "2024-01-15T12:00:00Z"},
                  {"createdBy", "ops"},
                  {"comment", "maintenance"}};
  auto result = client_->CreateSilence(silence);
  ASSERT_TRUE(result) << result.error().to_string();
  EXPECT_EQ((*result)["silenceID"], "s-2");
  EXPECT_EQ(posted_, silence);
}

TEST_F(AlertmanagerClientTest, DeleteSilence) {
  auto result = client_->DeleteSilence("s-1");
  ASSERT_TRUE(result) << result.error().to_string();
  EXPECT_EQ(deleted_, "s-1");
}

TEST_F(AlertmanagerClientTest, ReceiversStatusAndHealth) {
  auto receivers = client_->GetReceivers();
  ASSERT_TRUE(receivers) << receivers.error().to_string();
  EXPECT_EQ((*receivers)[0]["name"], "team-pager");

  auto status = client_->GetStatus();
  ASSERT_TRUE(status) << status.error().to_string();
  EXPECT_EQ((*status)["cluster"]["status"], "ready");

  auto health = client_->CheckHealth();
  ASSERT_TRUE(health) << health.error().to_string();
  EXPECT_EQ(*health, (json{{"status", "healthy"}}));
}

TEST(AlertmanagerClientOfflineTest, UnreachableUpstream) {
  FakeHttpServer closed;
  ASSERT_TRUE(closed.Start());
  std::string url = closed.url();
  closed.Stop();

  AlertmanagerClient client(HttpClientOptions{url, 500});
  auto result = client.GetAlerts(std::nullopt);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kUpstreamConnectionFailed);
  EXPECT_EQ(result.error().message().rfind("Failed to fetch alerts: ", 0), 0U);

  auto health = client.CheckHealth();
  ASSERT_FALSE(health);
  EXPECT_EQ(health.error().code(), ErrorCode::kUpstreamConnectionFailed);
}
