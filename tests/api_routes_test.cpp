#include <gtest/gtest.h>
#include "api/api_routes.h"
#include "core/service_context.h"
#include "test_support.h"

#include <memory>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

class ApiRoutesTest : public ::testing::Test {
protected:
    void SetUp() override {
        ServiceConfig cfg;
        cfg.modelPath = dir_.file("no_model.json");
        cfg.historyFile = dir_.file("scans.json");
        cfg.safeBrowsingApiKey.clear();
        cfg.virusTotalApiKey.clear();
        cfg.historyLimit = 2;
        cfg.historyMaxLimit = 3;
        ctx_ = std::make_unique<ServiceContext>(cfg, std::make_shared<FakeHttpClient>());
    }

    ApiResponse call(const std::string& method, const std::string& target,
                     const std::string& body = "",
                     const std::map<std::string, std::string>& headers = {}) {
        std::string head = method + " " + target + " HTTP/1.1\r\nHost: localhost\r\n";
        for (const auto& [k, v] : headers)
            head += k + ": " + v + "\r\n";
        head += "\r\n";

        ApiRequest req;
        EXPECT_TRUE(parseRequestHead(head, req));
        req.body = body;
        return ApiRoutes::handle(req, *ctx_);
    }

    ApiResponse analyze(const std::string& url) {
        return call("POST", "/analyze-url", json{{"url", url}}.dump());
    }

    TempDir dir_;
    std::unique_ptr<ServiceContext> ctx_;
};

TEST(ApiRequestParsingTest, ParsesRequestHead) {
    ApiRequest req;
    ASSERT_TRUE(parseRequestHead(
        "POST /scan-history?limit=5&tag=a%20b HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "X-User-Id:  alice \r\n"
        "Content-Length: 10\r\n\r\n", req));

    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.path, "/scan-history");
    EXPECT_EQ(req.query["limit"], "5");
    EXPECT_EQ(req.query["tag"], "a b");
    EXPECT_EQ(req.header("x-user-id"), std::optional<std::string>("alice"));
    EXPECT_EQ(req.header("content-length"), std::optional<std::string>("10"));
    EXPECT_FALSE(req.header("cookie").has_value());
}

TEST(ApiRequestParsingTest, RejectsMalformedHead) {
    ApiRequest req;
    EXPECT_FALSE(parseRequestHead("GARBAGE\r\n\r\n", req));
    EXPECT_FALSE(parseRequestHead("GET noslash HTTP/1.1\r\n\r\n", req));
    EXPECT_FALSE(parseRequestHead("GET / HTTP/1.1\r\nBadHeader\r\n\r\n", req));
}

TEST(ApiRequestParsingTest, SerializesResponse) {
    ApiResponse r;
    r.status = 404;
    r.body = "{}";
    std::string wire = serializeResponse(r);

    EXPECT_EQ(wire.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u);
    EXPECT_NE(wire.find("Content-Length: 2\r\n"), std::string::npos);
    EXPECT_EQ(wire.substr(wire.size() - 6), "\r\n\r\n{}");
}

TEST_F(ApiRoutesTest, AnalyzeReturnsVerdictAndStoresScan) {
    ApiResponse r = call("POST", "/analyze-url", R"({"url":"http://192.168.1.1/pay"})",
                         {{"X-User-Id", "alice"}});

    ASSERT_EQ(r.status, 200);
    json body = json::parse(r.body);
    EXPECT_EQ(body["url"], "http://192.168.1.1/pay");
    EXPECT_EQ(body["threatLevel"], "Suspicious");
    EXPECT_FALSE(body["safeToVisit"].get<bool>());

    ASSERT_EQ(ctx_->scanStore.size(), 1u);
    ScanRecord stored = ctx_->scanStore.recent(1)[0];
    EXPECT_EQ(stored.url, "http://192.168.1.1/pay");
    EXPECT_EQ(stored.userId, std::optional<std::string>("alice"));
}

TEST_F(ApiRoutesTest, AnalyzeRejectsBadInput) {
    EXPECT_EQ(call("POST", "/analyze-url", "{not json").status, 400);
    EXPECT_EQ(call("POST", "/analyze-url", "").status, 400);
    EXPECT_EQ(call("POST", "/analyze-url", "[]").status, 400);
    EXPECT_EQ(call("POST", "/analyze-url", R"({"link":"https://x.com"})").status, 400);
    EXPECT_EQ(call("POST", "/analyze-url", R"({"url":42})").status, 400);
    EXPECT_EQ(call("GET", "/analyze-url").status, 405);
    EXPECT_EQ(ctx_->scanStore.size(), 0u);
}

TEST_F(ApiRoutesTest, HealthAndReadiness) {
    ApiResponse health = call("GET", "/health");
    ASSERT_EQ(health.status, 200);
    EXPECT_EQ(json::parse(health.body),
              (json{{"status", "ok"}, {"service", "urlsentry"}}));

    // No artifact configured: still ready, reported as degraded
    ApiResponse ready = call("GET", "/ready");
    EXPECT_EQ(ready.status, 200);
    json body = json::parse(ready.body);
    EXPECT_EQ(body["status"], "DEGRADED");
    EXPECT_FALSE(body["classifierLoaded"].get<bool>());
    EXPECT_EQ(body["modelSource"], "heuristic-fallback");
    ASSERT_EQ(body["intelSources"].size(), 2u);
    for (const auto& s : body["intelSources"])
        EXPECT_FALSE(s["enabled"].get<bool>());
}

TEST_F(ApiRoutesTest, MetricsExposition) {
    analyze("https://google.com");
    ApiResponse r = call("GET", "/metrics");

    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.contentType.rfind("text/plain", 0), 0u);
    EXPECT_NE(r.body.find("urlsentry_http_requests_total"), std::string::npos);
    EXPECT_NE(r.body.find("urlsentry_url_analyses_total"), std::string::npos);
    EXPECT_NE(r.body.find("urlsentry_url_verdicts_safe_total"), std::string::npos);
}

TEST_F(ApiRoutesTest, AnalyticsCountsStoredScans) {
    analyze("https://google.com");
    analyze("https://example.com");
    analyze("http://192.168.1.1/pay");

    ApiResponse r = call("GET", "/analytics");
    ASSERT_EQ(r.status, 200);
    json body = json::parse(r.body);
    EXPECT_EQ(body["totalScans"], 3);
    EXPECT_EQ(body["safeCount"], 2);
    EXPECT_EQ(body["suspiciousCount"], 1);
    EXPECT_EQ(body["highRiskCount"], 0);
    ASSERT_TRUE(body["daily"].is_object());
    ASSERT_EQ(body["daily"].size(), 1u);
    EXPECT_EQ(body["daily"].begin().value()["total"], 3);
}

TEST_F(ApiRoutesTest, ScanHistoryLimits) {
    analyze("https://one.example.com");
    analyze("https://two.example.com");
    analyze("https://three.example.com");
    analyze("https://four.example.com");

    // Configured default of 2
    json defaults = json::parse(call("GET", "/scan-history").body);
    ASSERT_EQ(defaults.size(), 2u);
    EXPECT_EQ(defaults[0]["url"], "https://four.example.com");
    EXPECT_EQ(defaults[1]["url"], "https://three.example.com");

    json one = json::parse(call("GET", "/scan-history?limit=1").body);
    ASSERT_EQ(one.size(), 1u);
    EXPECT_TRUE(one[0].contains("scanId"));
    EXPECT_TRUE(one[0].contains("createdAt"));

    // Clamped to the configured maximum of 3
    json clamped = json::parse(call("GET", "/scan-history?limit=1000").body);
    EXPECT_EQ(clamped.size(), 3u);

    EXPECT_EQ(call("GET", "/scan-history?limit=abc").status, 400);
    EXPECT_EQ(call("GET", "/scan-history?limit=0").status, 400);
    EXPECT_EQ(call("GET", "/scan-history?limit=5x").status, 400);
}

TEST_F(ApiRoutesTest, DeleteScan) {
    analyze("https://google.com");
    std::string id = ctx_->scanStore.recent(1)[0].id;

    ApiResponse r = call("DELETE", "/scan-history/" + id);
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(json::parse(r.body), (json{{"status", "deleted"}, {"scanId", id}}));
    EXPECT_EQ(ctx_->scanStore.size(), 0u);

    EXPECT_EQ(call("DELETE", "/scan-history/" + id).status, 404);
    EXPECT_EQ(call("GET", "/scan-history/" + id).status, 405);
}

TEST_F(ApiRoutesTest, UnknownEndpoint) {
    ApiResponse r = call("GET", "/admin");
    EXPECT_EQ(r.status, 404);
    EXPECT_TRUE(json::parse(r.body).contains("error"));
}
