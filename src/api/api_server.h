#pragma once
#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>

using SOCKET = int;
constexpr SOCKET INVALID_SOCKET = -1;

struct ServiceContext;

class ApiServer {
public:
    explicit ApiServer(ServiceContext& ctx);
    ~ApiServer();

    // Binds synchronously so a bad host/port fails startup; throws
    // std::runtime_error on socket errors.
    void start(const std::string& host, int port);
    void stop();

    // Port actually bound; differs from the requested one when it was 0.
    int port() const { return port_; }

private:
    struct Connection {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void run();
    void serve(SOCKET client);
    void reapFinished();

    ServiceContext& ctx_;
    std::atomic<bool> running_{false};
    std::thread thread_;
    SOCKET listenSock_{INVALID_SOCKET};
    int port_ = 0;

    std::mutex connMutex_;
    std::list<Connection> connections_;
};
