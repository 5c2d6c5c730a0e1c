#pragma once

#include "http_types.hpp"
#include "router.hpp"
#include <atomic>
#include <cstdint>
#include <list>
#include <mutex>
#include <string>
#include <thread>

namespace swiv {

// Minimal blocking HTTP/1.1 server: one thread per connection, one request
// per connection. stop() shuts down live connections and joins their threads,
// so the router may be destroyed once it returns.
class HttpServer {
public:
    HttpServer(const std::string& host, uint16_t port, const Router& router,
               int read_timeout_ms = 10000);
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Port actually bound (useful when constructed with port 0)
    uint16_t port() const { return port_; }

private:
    struct Connection {
        int fd = -1;              // closed by the connection thread when done
        std::thread thread;
        std::atomic<bool> done{false};
    };

    void server_thread();
    void run_connection(Connection& conn);

    // Join and drop finished connections. Caller holds connections_mutex_.
    void reap_finished();

    void handle_client(int client_fd);

    // Returns false once the peer is gone
    bool send_all(int fd, const char* data, size_t size);
    bool send_response(int fd, Response response, bool head_only);
    bool send_simple(int fd, int status, const std::string& body);

    std::string host_;
    uint16_t port_;
    const Router& router_;
    int read_timeout_ms_;
    int server_fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::mutex connections_mutex_;
    std::list<Connection> connections_;
};

} // namespace swiv
