#include "api/api_server.h"
#include "api/api_routes.h"
#include "core/logger.h"
#include "core/service_context.h"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <sys/time.h>
#include <unistd.h>

namespace {

constexpr size_t kMaxHeadBytes = 16 * 1024;
constexpr size_t kMaxBodyBytes = 1024 * 1024;
constexpr int kRecvTimeoutSec = 10;

void sendAll(SOCKET s, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = send(s, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            Logger::instance().log(LogLevel::Warn,
                "ApiServer: send() failed: " + std::string(std::strerror(errno)));
            return;
        }
        off += static_cast<size_t>(n);
    }
}

void reply(SOCKET s, int status, const std::string& detail) {
    ApiResponse r;
    r.status = status;
    r.body = nlohmann::json{{"error", statusText(status)}, {"detail", detail}}.dump();
    sendAll(s, serializeResponse(r));
}

} // namespace

ApiServer::ApiServer(ServiceContext& ctx)
    : ctx_(ctx) {}

ApiServer::~ApiServer() {
    stop();
}

void ApiServer::start(const std::string& host, int port) {
    listenSock_ = socket(AF_INET, SOCK_STREAM, 0);
    if (listenSock_ == INVALID_SOCKET)
        throw std::runtime_error("ApiServer: socket() failed: " +
                                 std::string(std::strerror(errno)));

    int opt = 1;
    if (setsockopt(listenSock_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        Logger::instance().log(LogLevel::Warn,
            "ApiServer: setsockopt(SO_REUSEADDR) failed");
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        close(listenSock_);
        listenSock_ = INVALID_SOCKET;
        throw std::runtime_error("ApiServer: invalid listen address " + host);
    }

    if (bind(listenSock_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string err = std::strerror(errno);
        close(listenSock_);
        listenSock_ = INVALID_SOCKET;
        throw std::runtime_error("ApiServer: bind() failed on " + host + ":" +
                                 std::to_string(port) + ": " + err);
    }

    if (listen(listenSock_, 64) < 0) {
        std::string err = std::strerror(errno);
        close(listenSock_);
        listenSock_ = INVALID_SOCKET;
        throw std::runtime_error("ApiServer: listen() failed: " + err);
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(listenSock_, reinterpret_cast<sockaddr*>(&bound), &len) == 0)
        port_ = ntohs(bound.sin_port);
    else
        port_ = port;

    Logger::instance().log(LogLevel::Info,
        "API listening on " + host + ":" + std::to_string(port_));

    running_ = true;
    thread_ = std::thread(&ApiServer::run, this);
}

void ApiServer::stop() {
    running_ = false;
    // Close listener to interrupt accept()
    if (listenSock_ != INVALID_SOCKET) {
        shutdown(listenSock_, SHUT_RDWR);
        close(listenSock_);
        listenSock_ = INVALID_SOCKET;
    }
    if (thread_.joinable())
        thread_.join();

    std::list<Connection> pending;
    {
        std::lock_guard lock(connMutex_);
        pending.swap(connections_);
    }
    for (auto& c : pending) {
        if (c.thread.joinable())
            c.thread.join();
    }
}

void ApiServer::reapFinished() {
    std::lock_guard lock(connMutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable())
                it->thread.join();
            it = connections_.erase(it);
        } else {
            ++it;
        }
    }
}

void ApiServer::run() {
    while (running_) {
        SOCKET c = accept(listenSock_, nullptr, nullptr);
        if (c == INVALID_SOCKET) {
            if (running_ && errno != EINTR) { // Only log if we're still supposed to be running
                Logger::instance().log(LogLevel::Warn,
                    "ApiServer: accept() failed: " + std::string(std::strerror(errno)));
            }
            continue;
        }

        timeval tv{};
        tv.tv_sec = kRecvTimeoutSec;
        if (setsockopt(c, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
            Logger::instance().log(LogLevel::Warn,
                "ApiServer: setsockopt(SO_RCVTIMEO) failed");
        }

        reapFinished();

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard lock(connMutex_);
        connections_.push_back(Connection{
            std::thread([this, c, done] {
                serve(c);
                done->store(true);
            }),
            done});
    }
}

void ApiServer::serve(SOCKET client) {
    std::string data;
    char buf[4096];
    size_t headEnd = std::string::npos;

    while (headEnd == std::string::npos) {
        ssize_t n = recv(client, buf, sizeof(buf), 0);
        if (n <= 0) {
            close(client);
            return;
        }
        data.append(buf, static_cast<size_t>(n));
        headEnd = data.find("\r\n\r\n");
        if (headEnd == std::string::npos && data.size() > kMaxHeadBytes) {
            reply(client, 400, "request head too large");
            close(client);
            return;
        }
    }

    ApiRequest req;
    if (!parseRequestHead(data.substr(0, headEnd + 2), req)) {
        reply(client, 400, "malformed request");
        close(client);
        return;
    }

    size_t contentLength = 0;
    if (auto cl = req.header("content-length")) {
        try {
            contentLength = std::stoul(*cl);
        } catch (const std::exception&) {
            reply(client, 400, "invalid Content-Length");
            close(client);
            return;
        }
    }
    if (contentLength > kMaxBodyBytes) {
        reply(client, 413, "request body too large");
        close(client);
        return;
    }

    req.body = data.substr(headEnd + 4);
    while (req.body.size() < contentLength) {
        ssize_t n = recv(client, buf, sizeof(buf), 0);
        if (n <= 0) {
            Logger::instance().log(LogLevel::Warn,
                "ApiServer: connection closed before full body was received");
            close(client);
            return;
        }
        req.body.append(buf, static_cast<size_t>(n));
    }
    req.body.resize(contentLength);

    try {
        ApiResponse resp = ApiRoutes::handle(req, ctx_);
        Logger::instance().log(LogLevel::Debug,
            req.method + " " + req.path + " -> " + std::to_string(resp.status));
        sendAll(client, serializeResponse(resp));
    } catch (const std::exception& ex) {
        Logger::instance().log(LogLevel::Error,
            "ApiServer: Exception handling request: " + std::string(ex.what()));
        reply(client, 500, "internal error");
    }
    close(client);
}
