#include "api/api_routes.h"
#include "core/logger.h"
#include "core/service_context.h"
#include "engine/verdict_json.h"
#include "monitoring/health.h"
#include "monitoring/metrics.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

ApiResponse jsonResponse(int status, const json& body) {
    ApiResponse r;
    r.status = status;
    r.body = dumpJson(body);
    return r;
}

ApiResponse errorResponse(int status, const std::string& detail) {
    return jsonResponse(status, json{{"error", statusText(status)}, {"detail", detail}});
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percentDecode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '+') {
            out += ' ';
        } else if (s[i] == '%' && i + 2 < s.size() &&
                   hexValue(s[i + 1]) >= 0 && hexValue(s[i + 2]) >= 0) {
            out += static_cast<char>(hexValue(s[i + 1]) * 16 + hexValue(s[i + 2]));
            i += 2;
        } else {
            out += s[i];
        }
    }
    return out;
}

void parseQuery(const std::string& qs, std::map<std::string, std::string>& out) {
    std::stringstream ss(qs);
    std::string pair;
    while (std::getline(ss, pair, '&')) {
        if (pair.empty()) continue;
        size_t eq = pair.find('=');
        if (eq == std::string::npos)
            out[percentDecode(pair)] = "";
        else
            out[percentDecode(pair.substr(0, eq))] = percentDecode(pair.substr(eq + 1));
    }
}

json countsJson(const LevelCounts& c) {
    return json{
        {"total", c.total},
        {"safe", c.safe},
        {"suspicious", c.suspicious},
        {"highRisk", c.highRisk}
    };
}

void recordVerdict(const ThreatVerdict& v) {
    auto& m = Metrics::instance();
    m.inc("url_analyses_total");
    switch (v.threatLevel) {
    case ThreatLevel::Safe: m.inc("url_verdicts_safe_total"); break;
    case ThreatLevel::Suspicious: m.inc("url_verdicts_suspicious_total"); break;
    case ThreatLevel::HighRisk: m.inc("url_verdicts_high_risk_total"); break;
    }
}

const std::string kHistoryPrefix = "/scan-history/";

} // namespace

std::optional<std::string> ApiRequest::header(const std::string& lowerName) const {
    auto it = headers.find(lowerName);
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

const char* statusText(int status) {
    switch (status) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 413: return "Payload Too Large";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
    default:  return "Unknown";
    }
}

bool parseRequestHead(const std::string& head, ApiRequest& req) {
    std::istringstream in(head);
    std::string line;
    if (!std::getline(in, line)) return false;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    std::istringstream rl(line);
    std::string target, version;
    if (!(rl >> req.method >> target >> version)) return false;
    if (version.rfind("HTTP/", 0) != 0 || target.empty() || target[0] != '/')
        return false;

    size_t q = target.find('?');
    req.path = percentDecode(target.substr(0, q));
    if (q != std::string::npos)
        parseQuery(target.substr(q + 1), req.query);

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;
        size_t colon = line.find(':');
        if (colon == std::string::npos) return false;
        req.headers[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return true;
}

std::string serializeResponse(const ApiResponse& resp) {
    std::ostringstream out;
    out << "HTTP/1.1 " << resp.status << " " << statusText(resp.status) << "\r\n";
    out << "Content-Type: " << resp.contentType << "\r\n";
    out << "Content-Length: " << resp.body.size() << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";
    out << resp.body;
    return out.str();
}

ApiResponse ApiRoutes::handle(const ApiRequest& req, ServiceContext& ctx) {
    Metrics::instance().inc("http_requests_total");

    if (req.path == "/analyze-url") {
        if (req.method != "POST") return errorResponse(405, "use POST");
        return analyzeUrl(req, ctx);
    }
    if (req.path == "/health") {
        if (req.method != "GET") return errorResponse(405, "use GET");
        return jsonResponse(200, json{{"status", "ok"}, {"service", "urlsentry"}});
    }
    if (req.path == "/ready") {
        if (req.method != "GET") return errorResponse(405, "use GET");
        return ready(ctx);
    }
    if (req.path == "/metrics") {
        if (req.method != "GET") return errorResponse(405, "use GET");
        ApiResponse r;
        r.contentType = "text/plain; version=0.0.4; charset=utf-8";
        r.body = Metrics::instance().renderPrometheus();
        return r;
    }
    if (req.path == "/analytics") {
        if (req.method != "GET") return errorResponse(405, "use GET");
        return analytics(ctx);
    }
    if (req.path == "/scan-history") {
        if (req.method != "GET") return errorResponse(405, "use GET");
        return scanHistory(req, ctx);
    }
    if (req.path.rfind(kHistoryPrefix, 0) == 0 && req.path.size() > kHistoryPrefix.size()) {
        if (req.method != "DELETE") return errorResponse(405, "use DELETE");
        return deleteScan(req.path.substr(kHistoryPrefix.size()), ctx);
    }

    return errorResponse(404, "endpoint not found");
}

ApiResponse ApiRoutes::analyzeUrl(const ApiRequest& req, ServiceContext& ctx) {
    json body = json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object())
        return errorResponse(400, "request body must be a JSON object");
    if (!body.contains("url") || !body["url"].is_string())
        return errorResponse(400, "field 'url' must be a string");

    ThreatVerdict verdict = ctx.engine.analyze(body["url"].get<std::string>());
    recordVerdict(verdict);

    try {
        ScanRecord rec = ctx.scanStore.save(verdict, req.header("x-user-id"));
        Logger::instance().log(LogLevel::Debug,
            "Scan " + rec.id + " stored: " + threatLevelToString(verdict.threatLevel));
    } catch (const std::exception& e) {
        Metrics::instance().inc("scan_store_errors_total");
        Logger::instance().log(LogLevel::Error,
            "ScanStore: Failed to persist scan: " + std::string(e.what()));
    }

    return jsonResponse(200, verdict);
}

ApiResponse ApiRoutes::ready(ServiceContext& ctx) {
    HealthStatus h = Health::check(ctx.engine, ctx.intel.get());

    json sources = json::array();
    for (const auto& s : h.intelSources)
        sources.push_back(json{{"name", s.name}, {"enabled", s.enabled}});

    json body{
        {"status", h.ok ? "READY" : "DEGRADED"},
        {"message", h.message},
        {"classifierLoaded", h.classifierLoaded},
        {"modelSource", h.modelSource},
        {"intelSources", sources}
    };
    // Fallback mode still serves analyses; DEGRADED is reported, not failed
    return jsonResponse(200, body);
}

ApiResponse ApiRoutes::analytics(ServiceContext& ctx) {
    LevelCounts all = ctx.scanStore.countsByLevel();

    json daily = json::object();
    for (const auto& [day, counts] : ctx.scanStore.countsByDay())
        daily[day] = countsJson(counts);

    json body{
        {"totalScans", all.total},
        {"safeCount", all.safe},
        {"suspiciousCount", all.suspicious},
        {"highRiskCount", all.highRisk},
        {"daily", daily}
    };
    return jsonResponse(200, body);
}

ApiResponse ApiRoutes::scanHistory(const ApiRequest& req, ServiceContext& ctx) {
    int limit = ctx.config.historyLimit;
    auto it = req.query.find("limit");
    if (it != req.query.end()) {
        try {
            size_t used = 0;
            limit = std::stoi(it->second, &used);
            if (used != it->second.size())
                return errorResponse(400, "limit must be an integer");
        } catch (const std::exception&) {
            return errorResponse(400, "limit must be an integer");
        }
        if (limit < 1)
            return errorResponse(400, "limit must be at least 1");
        limit = std::min(limit, ctx.config.historyMaxLimit);
    }

    json records = ctx.scanStore.recent(static_cast<size_t>(limit));
    return jsonResponse(200, records);
}

ApiResponse ApiRoutes::deleteScan(const std::string& id, ServiceContext& ctx) {
    bool removed = false;
    try {
        removed = ctx.scanStore.remove(id);
    } catch (const std::exception& e) {
        Metrics::instance().inc("scan_store_errors_total");
        Logger::instance().log(LogLevel::Error,
            "ScanStore: Failed to persist removal of " + id + ": " + e.what());
        return errorResponse(500, "scan history could not be written");
    }
    if (!removed)
        return errorResponse(404, "scan " + id + " not found");
    return jsonResponse(200, json{{"status", "deleted"}, {"scanId", id}});
}
