#pragma once

#include "file_stream.hpp"
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>

namespace swiv {

// Read-only view of one inbound request
class Request {
public:
    Request() = default;
    Request(std::string method, std::string path,
            std::unordered_map<std::string, std::string> query,
            std::unordered_map<std::string, std::string> headers);

    const std::string& method() const { return method_; }

    // Decoded path, query string already stripped
    const std::string& path() const { return path_; }

    // Empty string when the parameter is missing
    std::string query(const std::string& key) const;

    // Case-insensitive lookup. Empty string when the header is missing.
    std::string header(const std::string& name) const;

private:
    std::string method_ = "GET";
    std::string path_ = "/";
    std::unordered_map<std::string, std::string> query_;
    std::unordered_map<std::string, std::string> headers_; // lower-case keys
};

// Either a complete string or a byte-chunk stream
using Body = std::variant<std::string, FileStream>;

struct Response {
    int status = 200;
    std::map<std::string, std::string> headers;
    Body body;

    Response(int status_code, std::map<std::string, std::string> hdrs, Body b)
        : status(status_code), headers(std::move(hdrs)), body(std::move(b)) {}

    static Response text(int status_code, const std::string& body) {
        return Response(status_code, {{"Content-Type", "text/plain"}}, body);
    }

    bool is_stream() const { return std::holds_alternative<FileStream>(body); }
};

const char* status_text(int status);

} // namespace swiv
