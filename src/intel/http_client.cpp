#include "intel/http_client.h"
#include "intel/curl_raii.h"
#include "core/logger.h"

#include <mutex>

namespace {

constexpr size_t kMaxResponseBytes = 2 * 1024 * 1024;

struct WriteBuffer {
    std::string data;
    bool truncated = false;
};

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buf = static_cast<WriteBuffer*>(userdata);
    size_t total = size * nmemb;
    if (buf->data.size() + total > kMaxResponseBytes) {
        buf->truncated = true;
        return 0;   // aborts the transfer with CURLE_WRITE_ERROR
    }
    buf->data.append(ptr, total);
    return total;
}

std::once_flag g_curlInit;

} // namespace

CurlHttpClient::CurlHttpClient() {
    std::call_once(g_curlInit, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            Logger::instance().log(LogLevel::Error,
                std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
        }
    });
}

HttpResponse CurlHttpClient::get(const std::string& url,
                                 const HttpHeaders& headers,
                                 long timeoutMs) {
    return perform(url, nullptr, headers, timeoutMs);
}

HttpResponse CurlHttpClient::post(const std::string& url,
                                  const std::string& body,
                                  const HttpHeaders& headers,
                                  long timeoutMs) {
    return perform(url, &body, headers, timeoutMs);
}

HttpResponse CurlHttpClient::perform(const std::string& url,
                                     const std::string* body,
                                     const HttpHeaders& headers,
                                     long timeoutMs) {
    CurlPtr curl(curl_easy_init());
    if (!curl)
        throw HttpError("curl_easy_init failed");

    curl_slist* rawList = nullptr;
    for (const auto& [k, v] : headers) {
        std::string line = k + ": " + v;
        curl_slist* next = curl_slist_append(rawList, line.c_str());
        if (!next) {
            curl_slist_free_all(rawList);
            throw HttpError("curl_slist_append failed");
        }
        rawList = next;
    }
    CurlSlistPtr headerList(rawList);

    WriteBuffer buf;
    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, timeoutMs);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, timeoutMs);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(h, CURLOPT_USERAGENT, "urlsentry/1.0");
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &buf);
    if (headerList)
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headerList.get());
    if (body) {
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        if (rc == CURLE_WRITE_ERROR && buf.truncated)
            throw HttpError("response exceeds size limit");
        throw HttpError(curl_easy_strerror(rc), rc == CURLE_OPERATION_TIMEDOUT);
    }

    HttpResponse r;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.status);
    r.body = std::move(buf.data);
    return r;
}
