/**
 * @file http_json_client_test.cpp
 * @brief Tests for the JSON-over-HTTP upstream client
 */

#include "upstream/http_json_client.h"

#include <gtest/gtest.h>

#include "fake_http_server.h"

using namespace monitorgate::upstream;
using monitorgate::upstream::testing::FakeHttpServer;
using monitorgate::utils::ErrorCode;
using nlohmann::json;

class HttpJsonClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto& server = fake_.server();

    // Echo the path and decoded parameters back as JSON
    server.Get("/echo", [](const httplib::Request& req, httplib::Response& res) {
      json params = json::object();
      for (const auto& [key, value] : req.params) {
        params[key].push_back(value);
      }
      res.set_content(json{{"path", req.path}, {"params", params}}.dump(), "application/json");
    });
    server.Get("/prefix/api/v1/labels", [](const httplib::Request&, httplib::Response& res) {
      res.set_content(R"({"status":"success","data":["job"]})", "application/json");
    });
    server.Get("/bad-request", [](const httplib::Request&, httplib::Response& res) {
      res.status = 400;
      res.set_content(R"({"status":"error","errorType":"bad_data","error":"parse error at char 3"})",
                      "application/json");
    });
    server.Get("/missing", [](const httplib::Request&, httplib::Response& res) {
      res.status = 404;
      res.set_content("page not found", "text/plain");
    });
    server.Get("/unavailable", [](const httplib::Request&, httplib::Response& res) {
      res.status = 503;
      res.set_content("\"service unavailable\"", "application/json");
    });
    server.Get("/multibyte-error", [](const httplib::Request&, httplib::Response& res) {
      std::string body = "x";
      for (int i = 0; i < 150; ++i) {
        body += "\xC3\xA9";  // U+00E9
      }
      res.status = 500;
      res.set_content(body, "text/plain; charset=utf-8");
    });
    server.Get("/teapot", [](const httplib::Request&, httplib::Response& res) { res.status = 418; });
    server.Get("/not-json", [](const httplib::Request&, httplib::Response& res) {
      res.set_content("<html>oops</html>", "text/html");
    });
    server.Get("/slow", [](const httplib::Request&, httplib::Response& res) {
      std::this_thread::sleep_for(std::chrono::milliseconds(600));
      res.set_content("{}", "application/json");
    });
    server.Get("/healthy", [](const httplib::Request&, httplib::Response& res) {
      res.set_content("Healthy.", "text/plain");
    });
    server.Post("/items", [](const httplib::Request& req, httplib::Response& res) {
      auto body = json::parse(req.body);
      res.set_content(json{{"received", body}, {"contentType", req.get_header_value("Content-Type")}}.dump(),
                      "application/json");
    });
    server.Post("/accepted", [](const httplib::Request&, httplib::Response& res) { res.status = 200; });
    server.Delete("/items/42", [](const httplib::Request&, httplib::Response& res) { res.status = 200; });

    ASSERT_TRUE(fake_.Start());
  }

  void TearDown() override { fake_.Stop(); }

  HttpJsonClient MakeClient(const std::string& suffix = "", int timeout_ms = 2000) {
    return HttpJsonClient(HttpClientOptions{fake_.url() + suffix, timeout_ms});
  }

  FakeHttpServer fake_;
};

TEST_F(HttpJsonClientTest, GetParsesJsonAndForwardsParams) {
  auto client = MakeClient();
  auto result = client.Get("/echo", {{"query", "up{job=\"node\"}"}, {"match[]", "a"}, {"match[]", "b"}});
  ASSERT_TRUE(result) << result.error().to_string();

  EXPECT_EQ((*result)["path"], "/echo");
  EXPECT_EQ((*result)["params"]["query"], json::array({"up{job=\"node\"}"}));
  EXPECT_EQ((*result)["params"]["match[]"].size(), 2U);
}

TEST_F(HttpJsonClientTest, BaseUrlPathPrefixIsPrepended) {
  auto client = MakeClient("/prefix/");
  auto result = client.Get("/api/v1/labels");
  ASSERT_TRUE(result) << result.error().to_string();
  EXPECT_EQ((*result)["data"], json::array({"job"}));
}

TEST_F(HttpJsonClientTest, BadRequestCarriesUpstreamReason) {
  auto result = MakeClient().Get("/bad-request");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kUpstreamBadRequest);
  EXPECT_NE(result.error().message().find("status code 400"), std::string::npos);
  EXPECT_NE(result.error().message().find("parse error at char 3"), std::string::npos);
}

TEST_F(HttpJsonClientTest, NotFound) {
  auto result = MakeClient().Get("/missing");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kUpstreamNotFound);
  EXPECT_NE(result.error().message().find("page not found"), std::string::npos);
}

TEST_F(HttpJsonClientTest, ServerError) {
  auto result = MakeClient().Get("/unavailable");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kUpstreamServerError);
  EXPECT_NE(result.error().message().find("service unavailable"), std::string::npos);
}

TEST_F(HttpJsonClientTest, OtherStatusIsHttpError) {
  auto result = MakeClient().Get("/teapot");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kUpstreamHttpError);
}

TEST_F(HttpJsonClientTest, NonJsonBodyIsInvalidResponse) {
  auto result = MakeClient().Get("/not-json");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kUpstreamInvalidResponse);
}

TEST_F(HttpJsonClientTest, SlowUpstreamTimesOut) {
  auto result = MakeClient("", 100).Get("/slow");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kUpstreamTimeout);
}

TEST_F(HttpJsonClientTest, ConnectionRefused) {
  FakeHttpServer closed;
  ASSERT_TRUE(closed.Start());
  std::string url = closed.url();
  closed.Stop();

  HttpJsonClient client(HttpClientOptions{url, 500});
  auto result = client.Get("/anything");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kUpstreamConnectionFailed);
}

TEST_F(HttpJsonClientTest, PostSendsJsonBody) {
  auto result = MakeClient().Post("/items", json::array({json{{"labels", {{"alertname", "Test"}}}}}));
  ASSERT_TRUE(result) << result.error().to_string();
  EXPECT_EQ((*result)["received"][0]["labels"]["alertname"], "Test");
  EXPECT_EQ((*result)["contentType"], "application/json");
}

TEST_F(HttpJsonClientTest, EmptyResponseBodyIsNull) {
  auto posted = MakeClient().Post("/accepted", json::object());
  ASSERT_TRUE(posted) << posted.error().to_string();
  EXPECT_TRUE(posted->is_null());

  auto deleted = MakeClient().Delete("/items/42");
  ASSERT_TRUE(deleted) << deleted.error().to_string();
  EXPECT_TRUE(deleted->is_null());
}

TEST_F(HttpJsonClientTest, GetStatusReturnsCodeWithoutParsing) {
  auto result = MakeClient().GetStatus("/healthy");
  ASSERT_TRUE(result) << result.error().to_string();
  EXPECT_EQ(*result, 200);

  auto failed = MakeClient().GetStatus("/unavailable");
  ASSERT_FALSE(failed);
  EXPECT_EQ(failed.error().code(), ErrorCode::kUpstreamServerError);
}

TEST_F(HttpJsonClientTest, LongMultibyteErrorBodyIsCutOnCharacterBoundary) {
  auto result = MakeClient().Get("/multibyte-error");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kUpstreamServerError);

  const std::string& message = result.error().message();
  std::string detail = message.substr(message.find(": ") + 2);
  EXPECT_EQ(detail.size(), 199U);
  EXPECT_EQ(detail.front(), 'x');
  EXPECT_NE(static_cast<unsigned char>(detail.back()), 0xC3);
  EXPECT_NO_THROW(json{{"error", message}}.dump());
}

TEST_F(HttpJsonClientTest, GetEncodesReservedCharactersInParams) {
  auto result = MakeClient("/").Get("/echo", {{"query", "a&b=c + d%"}, {"match[]", "{__name__=~\"x|y\"}"}});
  ASSERT_TRUE(result) << result.error().to_string();

  EXPECT_EQ((*result)["path"], "/echo");
  EXPECT_EQ((*result)["params"]["query"], json::array({"a&b=c + d%"}));
  EXPECT_EQ((*result)["params"]["match[]"], json::array({"{__name__=~\"x|y\"}"}));
}

TEST(HttpJsonClientTargetTest, EncodeSegmentEscapesSlashesAndSpaces) {
  EXPECT_EQ(HttpJsonClient::EncodeSegment("0c6b7d1e-4a2f-4b9e-9c3d-2f1a5e6b7c8d"), "0c6b7d1e-4a2f-4b9e-9c3d-2f1a5e6b7c8d");
  EXPECT_EQ(HttpJsonClient::EncodeSegment("job"), "job");
  EXPECT_EQ(HttpJsonClient::EncodeSegment("a/b c"), "a%2Fb%20c");
  EXPECT_EQ(HttpJsonClient::EncodeSegment("x?y#z"), "x%3Fy%23z");
}

TEST(HttpJsonClientTargetTest, DescribePrefixesMessageAndKeepsCode) {
  auto error = monitorgate::utils::MakeError(ErrorCode::kUpstreamTimeout, "Request timed out", "ctx");
  auto described = Describe("Failed to fetch rules")(error);
  EXPECT_EQ(described.code(), ErrorCode::kUpstreamTimeout);
  EXPECT_EQ(described.message(), "Failed to fetch rules: Request timed out");
  EXPECT_EQ(described.context(), "ctx");
}
