#include "http_server.hpp"
#include "http_parser.hpp"
#include <spdlog/spdlog.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>
#include <functional>
#include <sstream>

namespace swiv {

HttpServer::HttpServer(const std::string& host, uint16_t port, const Router& router,
                       int read_timeout_ms)
    : host_(host)
    , port_(port)
    , router_(router)
    , read_timeout_ms_(read_timeout_ms)
{
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    server_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        spdlog::error("HTTP: Failed to create socket");
        return false;
    }

    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    if (inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
        spdlog::error("HTTP: Invalid listen address {}", host_);
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (bind(server_fd_, (sockaddr*)&addr, sizeof(addr)) < 0) {
        spdlog::error("HTTP: Failed to bind to {}:{}", host_, port_);
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, 16) < 0) {
        spdlog::error("HTTP: Failed to listen");
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(server_fd_, (sockaddr*)&bound, &bound_len) == 0) {
        port_ = ntohs(bound.sin_port);
    }

    running_.store(true);
    thread_ = std::thread(&HttpServer::server_thread, this);
    spdlog::info("HTTP server listening on http://{}:{} (root: {})", host_, port_, router_.base());
    return true;
}

void HttpServer::stop() {
    running_.store(false);
    if (server_fd_ >= 0) {
        shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
    }
    if (thread_.joinable()) {
        thread_.join();
    }

    // No more accepts: wake every live connection and wait for it
    std::list<Connection> live;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto& conn : connections_) {
            if (conn.fd >= 0) {
                shutdown(conn.fd, SHUT_RDWR);
            }
        }
        live.splice(live.end(), connections_);
    }
    for (auto& conn : live) {
        if (conn.thread.joinable()) {
            conn.thread.join();
        }
    }
}

void HttpServer::server_thread() {
    while (running_.load()) {
        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept4(server_fd_, (sockaddr*)&client_addr, &client_len, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (running_.load()) {
                spdlog::debug("HTTP: Accept failed");
            }
            continue;
        }

        // Bound both directions: a client that stops sending or stops
        // reading gives up its thread after read_timeout_ms
        timeval tv{};
        tv.tv_sec = read_timeout_ms_ / 1000;
        tv.tv_usec = (read_timeout_ms_ % 1000) * 1000;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        std::lock_guard<std::mutex> lock(connections_mutex_);
        reap_finished();
        connections_.emplace_back();
        Connection& conn = connections_.back();
        conn.fd = client_fd;
        conn.thread = std::thread(&HttpServer::run_connection, this, std::ref(conn));
    }
}

void HttpServer::run_connection(Connection& conn) {
    try {
        handle_client(conn.fd);
    } catch (const std::exception& e) {
        spdlog::warn("HTTP: Connection aborted: {}", e.what());
    }

    std::lock_guard<std::mutex> lock(connections_mutex_);
    close(conn.fd);
    conn.fd = -1;
    conn.done.store(true);
}

void HttpServer::reap_finished() {
    for (auto it = connections_.begin(); it != connections_.end();) {
        if (it->done.load()) {
            it->thread.join();
            it = connections_.erase(it);
        } else {
            ++it;
        }
    }
}

void HttpServer::handle_client(int client_fd) {
    // Read until the blank line that ends the request head
    std::string head;
    char buf[4096];
    size_t head_end = std::string::npos;
    while (head_end == std::string::npos) {
        ssize_t n = recv(client_fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            if (!head.empty()) {
                send_simple(client_fd, 408, "Request timeout");
            }
            return;
        }
        head.append(buf, static_cast<size_t>(n));
        head_end = head.find("\r\n\r\n");
        if (head_end == std::string::npos && head.size() > max_request_head) {
            send_simple(client_fd, 431, "Request header fields too large");
            return;
        }
    }
    head.resize(head_end + 2);

    auto request = parse_request(head);
    if (!request) {
        send_simple(client_fd, 400, "Bad request");
        return;
    }

    const std::string& method = request->method();
    if (method != "GET" && method != "HEAD") {
        Response r(405, {{"Content-Type", "text/plain"}, {"Allow", "GET, HEAD"}},
                   std::string("Method not allowed"));
        send_response(client_fd, std::move(r), false);
        return;
    }

    Response response = router_.route(*request);
    int status = response.status;
    bool complete = send_response(client_fd, std::move(response), method == "HEAD");
    spdlog::info("{} {} -> {}{}", method, request->path(), status,
                 complete ? "" : " (client disconnected)");
}

bool HttpServer::send_all(int fd, const char* data, size_t size) {
    while (size > 0) {
        ssize_t n = send(fd, data, size, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        data += n;
        size -= static_cast<size_t>(n);
    }
    return true;
}

bool HttpServer::send_simple(int fd, int status, const std::string& body) {
    return send_response(fd, Response::text(status, body), false);
}

bool HttpServer::send_response(int fd, Response response, bool head_only) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << response.status << " " << status_text(response.status) << "\r\n";
    for (const auto& [name, value] : response.headers) {
        oss << name << ": " << value << "\r\n";
    }

    if (auto* text = std::get_if<std::string>(&response.body)) {
        oss << "Content-Length: " << text->size() << "\r\n"
            << "Connection: close\r\n"
            << "\r\n";
        std::string header = oss.str();
        if (!send_all(fd, header.data(), header.size())) return false;
        return head_only || send_all(fd, text->data(), text->size());
    }

    FileStream& stream = std::get<FileStream>(response.body);
    oss << "Transfer-Encoding: chunked\r\n"
        << "Cache-Control: no-cache\r\n"
        << "Connection: close\r\n"
        << "\r\n";
    std::string header = oss.str();
    if (!send_all(fd, header.data(), header.size())) return false;
    if (head_only) return true;

    // One HTTP chunk per file chunk; a dead peer just stops the pull and the
    // stream's destructor releases the file.
    std::string chunk;
    while (stream.next(chunk)) {
        std::ostringstream size_line;
        size_line << std::hex << chunk.size() << "\r\n";
        std::string prefix = size_line.str();
        if (!send_all(fd, prefix.data(), prefix.size()) ||
            !send_all(fd, chunk.data(), chunk.size()) ||
            !send_all(fd, "\r\n", 2)) {
            return false;
        }
    }
    return send_all(fd, "0\r\n\r\n", 5);
}

} // namespace swiv
