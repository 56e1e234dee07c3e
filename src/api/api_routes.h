#pragma once
#include <map>
#include <optional>
#include <string>

struct ServiceContext;

struct ApiRequest {
    std::string method;
    std::string path;                              // target without the query
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;    // names lower-cased
    std::string body;

    std::optional<std::string> header(const std::string& lowerName) const;
};

struct ApiResponse {
    int status = 200;
    std::string contentType = "application/json";
    std::string body;
};

// Parses the request line and headers (everything before the blank line).
// Returns false on a malformed head; the body is filled in by the caller.
bool parseRequestHead(const std::string& head, ApiRequest& req);

std::string serializeResponse(const ApiResponse& resp);

const char* statusText(int status);

class ApiRoutes {
public:
    static ApiResponse handle(const ApiRequest& req, ServiceContext& ctx);

private:
    static ApiResponse analyzeUrl(const ApiRequest& req, ServiceContext& ctx);
    static ApiResponse ready(ServiceContext& ctx);
    static ApiResponse analytics(ServiceContext& ctx);
    static ApiResponse scanHistory(const ApiRequest& req, ServiceContext& ctx);
    static ApiResponse deleteScan(const std::string& id, ServiceContext& ctx);
};
