/**
 * @file alertmanager_handler_test.cpp
 * @brief Routes under /api/alertmanager against a mocked alerts source
 */

#include "server/handlers/alertmanager_handler.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "gateway_test_fixture.h"

namespace monitorgate::server {
namespace {

using json = nlohmann::json;
using testing::GatewayTest;
using testing::JsonResult;
using testing::VoidResult;
using ::testing::_;
using ::testing::Eq;
using ::testing::Optional;
using ::testing::Return;
using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

json AlertRecords() {
  return json::array({
      json{{"id", "a1"},
           {"name", "HighCPU"},
           {"severity", "critical"},
           {"status", {{"state", "active"}}},
           {"startsAt", "2024-01-15T10:00:00.000Z"}},
      json{{"id", "a2"},
           {"name", "DiskFull"},
           {"severity", "warning"},
           {"status", {{"state", "active"}}},
           {"startsAt", "2024-01-15T09:00:00.000Z"}},
      json{{"id", "a3"},
           {"name", "NodeDown"},
           {"severity", "critical"},
           {"status", {{"state", "suppressed"}}},
           {"startsAt", "2024-01-15T11:00:00.000Z"}},
  });
}

json CompleteSilence() {
  return json{{"matchers", json::array({json{{"name", "alertname"}, {"value", "HighCPU"}, {"isRegex", false}}})},
              {"startsAt", "2024-01-15T10:00:00Z"},
              {"endsAt", "2024-01-15T12:00:00Z"},
              {"createdBy", "ops"},
              {"comment", "maintenance"}};
}

class AlertmanagerHandlerTest : public GatewayTest {};

TEST_F(AlertmanagerHandlerTest, AlertsRunThroughPipeline) {
  EXPECT_CALL(alerts_, GetAlerts(Eq(std::nullopt))).WillOnce(Return(JsonResult(AlertRecords())));
  StartServer();

  auto res = client_->Get("/api/alertmanager/alerts?severity=critical&sort=startsAt&fields=id");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);

  json body = Body(res);
  EXPECT_EQ(body["data"], json::array({json{{"id", "a1"}}, json{{"id", "a3"}}}));
  EXPECT_EQ(body["pagination"]["total"], 2);
}

TEST_F(AlertmanagerHandlerTest, AlertsFilterIsForwardedNotApplied) {
  EXPECT_CALL(alerts_, GetAlerts(Optional(Eq(std::string("severity=\"critical\"")))))
      .WillOnce(Return(JsonResult(AlertRecords())));
  StartServer();

  auto res = client_->Get("/api/alertmanager/alerts?filter=severity%3D%22critical%22");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(Body(res)["pagination"]["total"], 3);
}

TEST_F(AlertmanagerHandlerTest, AlertsTimestampRange) {
  EXPECT_CALL(alerts_, GetAlerts(_)).WillOnce(Return(JsonResult(AlertRecords())));
  StartServer();

  auto res = client_->Get("/api/alertmanager/alerts?startsAt=gte:2024-01-15T09:30:00Z&sort=-startsAt&fields=id");
  ASSERT_TRUE(res);
  EXPECT_EQ(Body(res)["data"], json::array({json{{"id", "a3"}}, json{{"id", "a1"}}}));
}

TEST_F(AlertmanagerHandlerTest, AlertsUpstreamFailure) {
  EXPECT_CALL(alerts_, GetAlerts(_))
      .WillOnce(Return(JsonResult(MakeUnexpected(
          MakeError(ErrorCode::kUpstreamConnectionFailed, "Failed to fetch alerts: connection refused")))));
  StartServer();

  auto res = client_->Get("/api/alertmanager/alerts");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 502);
  EXPECT_EQ(Body(res), (json{{"success", false}, {"error", "Failed to fetch alerts: connection refused"}}));
}

TEST_F(AlertmanagerHandlerTest, AlertGroupsPassThrough) {
  EXPECT_CALL(alerts_, GetAlertGroups(Optional(Eq(std::string("team=\"db\"")))))
      .WillOnce(Return(JsonResult(json::array({json{{"labels", {{"team", "db"}}}}}))));
  StartServer();

  auto res = client_->Get("/api/alertmanager/alerts/groups?filter=team%3D%22db%22");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(Body(res)["data"][0]["labels"]["team"], "db");
}

TEST_F(AlertmanagerHandlerTest, PostAlertsRequiresArray) {
  EXPECT_CALL(alerts_, PostAlerts(_)).Times(0);
  StartServer();

  auto object_body = client_->Post("/api/alertmanager/alerts", R"({"labels":{}})", "application/json");
  ASSERT_TRUE(object_body);
  EXPECT_EQ(object_body->status, 400);
  EXPECT_EQ(Body(object_body)["error"], "Request body must be an array of alerts");

  auto malformed = client_->Post("/api/alertmanager/alerts", "[{", "application/json");
  ASSERT_TRUE(malformed);
  EXPECT_EQ(malformed->status, 400);
}

TEST_F(AlertmanagerHandlerTest, PostAlertsForwardsBody) {
  json alerts = json::array({json{{"labels", {{"alertname", "Test"}}}}});
  EXPECT_CALL(alerts_, PostAlerts(Eq(alerts))).WillOnce(Return(VoidResult()));
  StartServer();

  auto res = client_->Post("/api/alertmanager/alerts", alerts.dump(), "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(Body(res), (json{{"success", true}, {"message", "Alerts posted successfully"}}));
}

TEST_F(AlertmanagerHandlerTest, PostAlertsUpstreamRejects) {
  EXPECT_CALL(alerts_, PostAlerts(_))
      .WillOnce(Return(VoidResult(
          MakeUnexpected(MakeError(ErrorCode::kUpstreamBadRequest, "Failed to post alerts: bad alert")))));
  StartServer();

  auto res = client_->Post("/api/alertmanager/alerts", "[]", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(Body(res)["error"], "Failed to post alerts: bad alert");
}

TEST_F(AlertmanagerHandlerTest, SilencesRunThroughPipeline) {
  json silences = json::array({
      json{{"id", "s1"}, {"createdBy", "ops"}, {"status", {{"state", "active"}}}},
      json{{"id", "s2"}, {"createdBy", "dev"}, {"status", {{"state", "expired"}}}},
      json{{"id", "s3"}, {"createdBy", "ops"}, {"status", {{"state", "expired"}}}},
  });
  EXPECT_CALL(alerts_, GetSilences(Optional(Eq(std::string("alertname=\"HighCPU\"")))))
      .WillOnce(Return(JsonResult(silences)));
  StartServer();

  auto res = client_->Get("/api/alertmanager/silences?filter=alertname%3D%22HighCPU%22&createdBy=ops&sort=-id");
  ASSERT_TRUE(res);
  json body = Body(res);
  ASSERT_EQ(body["data"].size(), 2U);
  EXPECT_EQ(body["data"][0]["id"], "s3");
  EXPECT_EQ(body["data"][1]["id"], "s1");
}

TEST_F(AlertmanagerHandlerTest, GetSilenceById) {
  EXPECT_CALL(alerts_, GetSilence("abc-123")).WillOnce(Return(JsonResult(json{{"id", "abc-123"}})));
  EXPECT_CALL(alerts_, GetSilence("missing"))
      .WillOnce(Return(JsonResult(MakeUnexpected(MakeError(ErrorCode::kUpstreamNotFound, "Failed to fetch silence")))));
  StartServer();

  auto found = client_->Get("/api/alertmanager/silence/abc-123");
  ASSERT_TRUE(found);
  EXPECT_EQ(found->status, 200);
  EXPECT_EQ(Body(found), (json{{"success", true}, {"data", {{"id", "abc-123"}}}}));

  auto missing = client_->Get("/api/alertmanager/silence/missing");
  ASSERT_TRUE(missing);
  EXPECT_EQ(missing->status, 404);
}

TEST_F(AlertmanagerHandlerTest, CreateSilenceRequiresFields) {
  EXPECT_CALL(alerts_, CreateSilence(_)).Times(0);
  StartServer();

  json incomplete = CompleteSilence();
  incomplete.erase("comment");
  auto res = client_->Post("/api/alertmanager/silences", incomplete.dump(), "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(Body(res)["error"], "Missing required fields: matchers, startsAt, endsAt, createdBy, comment");
}

TEST_F(AlertmanagerHandlerTest, CreateSilenceReturnsUpstreamId) {
  EXPECT_CALL(alerts_, CreateSilence(Eq(CompleteSilence())))
      .WillOnce(Return(JsonResult(json{{"silenceID", "new-silence"}})));
  StartServer();

  auto res = client_->Post("/api/alertmanager/silences", CompleteSilence().dump(), "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(Body(res)["data"]["silenceID"], "new-silence");
}

TEST_F(AlertmanagerHandlerTest, DeleteSilence) {
  EXPECT_CALL(alerts_, DeleteSilence("abc-123")).WillOnce(Return(VoidResult()));
  EXPECT_CALL(alerts_, DeleteSilence("gone"))
      .WillOnce(Return(VoidResult(MakeUnexpected(MakeError(ErrorCode::kUpstreamNotFound, "Failed to delete silence")))));
  StartServer();

  auto deleted = client_->Delete("/api/alertmanager/silence/abc-123");
  ASSERT_TRUE(deleted);
  EXPECT_EQ(deleted->status, 200);
  EXPECT_EQ(Body(deleted), (json{{"success", true}, {"message", "Silence deleted successfully"}}));

  auto gone = client_->Delete("/api/alertmanager/silence/gone");
  ASSERT_TRUE(gone);
  EXPECT_EQ(gone->status, 404);
  EXPECT_EQ(Body(gone)["error"], "Failed to delete silence");
}

TEST_F(AlertmanagerHandlerTest, StatusRoutesPassThrough) {
  EXPECT_CALL(alerts_, GetReceivers()).WillOnce(Return(JsonResult(json::array({json{{"name", "default"}}}))));
  EXPECT_CALL(alerts_, GetStatus()).WillOnce(Return(JsonResult(json{{"cluster", {{"status", "ready"}}}})));
  EXPECT_CALL(alerts_, CheckHealth()).WillOnce(Return(JsonResult(json{{"status", "healthy"}})));
  StartServer();

  auto receivers = client_->Get("/api/alertmanager/receivers");
  ASSERT_TRUE(receivers);
  EXPECT_EQ(Body(receivers)["data"][0]["name"], "default");

  auto status = client_->Get("/api/alertmanager/status");
  ASSERT_TRUE(status);
  EXPECT_EQ(Body(status)["data"]["cluster"]["status"], "ready");

  auto health = client_->Get("/api/alertmanager/health");
  ASSERT_TRUE(health);
  EXPECT_EQ(Body(health), (json{{"success", true}, {"data", {{"status", "healthy"}}}}));
}

TEST(AlertmanagerSilenceTest, IsCompleteSilence) {
  EXPECT_TRUE(AlertmanagerHandler::IsCompleteSilence(CompleteSilence()));
  EXPECT_FALSE(AlertmanagerHandler::IsCompleteSilence(json::array()));
  EXPECT_FALSE(AlertmanagerHandler::IsCompleteSilence(json::object()));

  for (const char* field : {"matchers", "startsAt", "endsAt", "createdBy", "comment"}) {
    json missing = CompleteSilence();
    missing.erase(field);
    EXPECT_FALSE(AlertmanagerHandler::IsCompleteSilence(missing)) << field;

    json null_value = CompleteSilence();
    null_value[field] = nullptr;
    EXPECT_FALSE(AlertmanagerHandler::IsCompleteSilence(null_value)) << field;
  }

  json empty_comment = CompleteSilence();
  empty_comment["comment"] = "";
  EXPECT_FALSE(AlertmanagerHandler::IsCompleteSilence(empty_comment));

  // An empty matcher list still counts as supplied
  json empty_matchers = CompleteSilence();
  empty_matchers["matchers"] = json::array();
  EXPECT_TRUE(AlertmanagerHandler::IsCompleteSilence(empty_matchers));
}

}  // namespace
}  // namespace monitorgate::server
