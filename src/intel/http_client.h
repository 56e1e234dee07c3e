#pragma once
#include <map>
#include <stdexcept>
#include <string>

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Transport-level failure: DNS, connect, TLS, timeout.
class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& what, bool timedOut = false)
        : std::runtime_error(what), timedOut_(timedOut) {}

    bool timedOut() const { return timedOut_; }

private:
    bool timedOut_;
};

using HttpHeaders = std::map<std::string, std::string>;

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url,
                             const HttpHeaders& headers,
                             long timeoutMs) = 0;

    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const HttpHeaders& headers,
                              long timeoutMs) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();

    HttpResponse get(const std::string& url,
                     const HttpHeaders& headers,
                     long timeoutMs) override;

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const HttpHeaders& headers,
                      long timeoutMs) override;

private:
    HttpResponse perform(const std::string& url,
                         const std::string* body,
                         const HttpHeaders& headers,
                         long timeoutMs);
};
