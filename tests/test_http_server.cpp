#include "http_server.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <functional>
#include <thread>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace swiv;
using swiv::test::TempDir;

namespace {

// Connected client socket, or -1. A non-zero rcvbuf shrinks the receive buffer.
int connect_client(uint16_t port, int rcvbuf = 0) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;

    if (rcvbuf > 0) {
        setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &rcvbuf, sizeof(rcvbuf));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (connect(fd, (sockaddr*)&addr, sizeof(addr)) < 0) {
        close(fd);
        return -1;
    }
    return fd;
}

// True while some descriptor of this process refers to `path`
bool file_is_open(const std::string& path) {
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator("/proc/self/fd", ec)) {
        std::error_code link_ec;
        auto target = std::filesystem::read_symlink(entry.path(), link_ec);
        if (!link_ec && target == path) return true;
    }
    return false;
}

bool wait_for(const std::function<bool()>& condition, std::chrono::milliseconds limit) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return condition();
}

// Sends a raw request and returns everything the server wrote back
std::string exchange(uint16_t port, const std::string& raw) {
    int fd = connect_client(port);
    if (fd < 0) return "";

    send(fd, raw.data(), raw.size(), MSG_NOSIGNAL);

    std::string response;
    char buf[4096];
    ssize_t n;
    while ((n = recv(fd, buf, sizeof(buf), 0)) > 0) {
        response.append(buf, static_cast<size_t>(n));
    }
    close(fd);
    return response;
}

// Undo Transfer-Encoding: chunked
std::string dechunk(const std::string& body) {
    std::string out;
    size_t pos = 0;
    while (pos < body.size()) {
        size_t eol = body.find("\r\n", pos);
        if (eol == std::string::npos) break;
        size_t size = std::stoul(body.substr(pos, eol - pos), nullptr, 16);
        if (size == 0) break;
        out += body.substr(eol + 2, size);
        pos = eol + 2 + size + 2;
    }
    return out;
}

class HttpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tmp.write("album/a.png", swiv::test::tiny_png());
        tmp.write("data.bin", swiv::test::pattern_bytes(10000));
        router = std::make_unique<Router>(tmp.path(), AuthGate("secret"), mime);
        server = std::make_unique<HttpServer>("127.0.0.1", 0, *router, 2000);
        ASSERT_TRUE(server->start());
    }

    void TearDown() override {
        if (server) server->stop();
    }

    TempDir tmp;
    MimeDetector mime;
    std::unique_ptr<Router> router;
    std::unique_ptr<HttpServer> server;
};

const char* const auth_header = "Authorization: Basic c2VjcmV0\r\n";

} // namespace

TEST_F(HttpServerTest, StreamsFileChunked) {
    std::string resp = exchange(server->port(),
        std::string("GET /data.bin HTTP/1.1\r\nHost: x\r\n") + auth_header + "\r\n");

    ASSERT_EQ(resp.compare(0, 15, "HTTP/1.1 200 OK"), 0) << resp.substr(0, 200);
    EXPECT_NE(resp.find("Transfer-Encoding: chunked\r\n"), std::string::npos);

    auto body_start = resp.find("\r\n\r\n");
    ASSERT_NE(body_start, std::string::npos);
    EXPECT_EQ(dechunk(resp.substr(body_start + 4)), swiv::test::pattern_bytes(10000));
}

TEST_F(HttpServerTest, ServesViewerMode) {
    std::string resp = exchange(server->port(),
        std::string("GET /album?mode=viewer HTTP/1.1\r\n") + auth_header + "\r\n");

    ASSERT_EQ(resp.compare(0, 15, "HTTP/1.1 200 OK"), 0);
    EXPECT_NE(resp.find("Content-Type: text/html\r\n"), std::string::npos);
    EXPECT_NE(resp.find("src=\"/album/a.png\""), std::string::npos);
}

TEST_F(HttpServerTest, ChallengesWithoutCredentials) {
    std::string resp = exchange(server->port(), "GET / HTTP/1.1\r\n\r\n");
    EXPECT_EQ(resp.compare(0, 25, "HTTP/1.1 401 Unauthorized"), 0);
    EXPECT_NE(resp.find("WWW-Authenticate: Basic realm=\"swiv\"\r\n"), std::string::npos);
}

TEST_F(HttpServerTest, HeadHasNoBody) {
    std::string resp = exchange(server->port(),
        std::string("HEAD /data.bin HTTP/1.1\r\n") + auth_header + "\r\n");
    ASSERT_EQ(resp.compare(0, 15, "HTTP/1.1 200 OK"), 0);
    EXPECT_EQ(resp.size(), resp.find("\r\n\r\n") + 4);
}

TEST_F(HttpServerTest, RejectsOtherMethods) {
    std::string resp = exchange(server->port(),
        std::string("DELETE /data.bin HTTP/1.1\r\n") + auth_header + "\r\n");
    EXPECT_EQ(resp.compare(0, 12, "HTTP/1.1 405"), 0);
    EXPECT_NE(resp.find("Allow: GET, HEAD\r\n"), std::string::npos);
}

TEST_F(HttpServerTest, MalformedRequestIsBadRequest) {
    std::string resp = exchange(server->port(), "NONSENSE\r\n\r\n");
    EXPECT_EQ(resp.compare(0, 12, "HTTP/1.1 400"), 0);
}

TEST_F(HttpServerTest, MissingPathIsBadRequest) {
    std::string resp = exchange(server->port(),
        std::string("GET /nope HTTP/1.1\r\n") + auth_header + "\r\n");
    EXPECT_EQ(resp.compare(0, 12, "HTTP/1.1 400"), 0);
    EXPECT_EQ(resp.substr(resp.size() - 11), "Bad request");
}

TEST_F(HttpServerTest, StopWaitsForInFlightConnection) {
    int fd = connect_client(server->port());
    ASSERT_GE(fd, 0);
    std::string partial = std::string("GET / HTTP/1.1\r\n") + auth_header;
    send(fd, partial.data(), partial.size(), MSG_NOSIGNAL);
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    // The connection thread is parked in recv; everything it uses goes away
    server->stop();
    server.reset();
    router.reset();

    send(fd, "\r\n", 2, MSG_NOSIGNAL);
    char buf[256];
    EXPECT_LE(recv(fd, buf, sizeof(buf), 0), 0);
    close(fd);
}

TEST(HttpServerTimeout, StalledReaderReleasesFile) {
    TempDir tmp;
    std::string big = tmp.write("big.bin", swiv::test::pattern_bytes(16 * 1024 * 1024));
    MimeDetector mime;
    Router router(tmp.path(), AuthGate(""), mime);
    HttpServer server("127.0.0.1", 0, router, 200);
    ASSERT_TRUE(server.start());

    int fd = connect_client(server.port(), 4096);
    ASSERT_GE(fd, 0);
    std::string request = "GET /big.bin HTTP/1.1\r\n\r\n";
    send(fd, request.data(), request.size(), MSG_NOSIGNAL);

    // Never read: the server must give up on send and close the file
    EXPECT_TRUE(wait_for([&] { return file_is_open(big); }, std::chrono::milliseconds(2000)));
    EXPECT_TRUE(wait_for([&] { return !file_is_open(big); }, std::chrono::milliseconds(5000)));

    close(fd);
    server.stop();
}
