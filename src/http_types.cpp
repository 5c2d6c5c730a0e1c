#include "http_types.hpp"
#include <algorithm>
#include <cctype>

namespace swiv {

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Request::Request(std::string method, std::string path,
                 std::unordered_map<std::string, std::string> query,
                 std::unordered_map<std::string, std::string> headers)
    : method_(std::move(method))
    , path_(std::move(path))
    , query_(std::move(query))
{
    for (auto& [name, value] : headers) {
        headers_[to_lower(name)] = std::move(value);
    }
}

std::string Request::query(const std::string& key) const {
    auto it = query_.find(key);
    return it != query_.end() ? it->second : std::string();
}

std::string Request::header(const std::string& name) const {
    auto it = headers_.find(to_lower(name));
    return it != headers_.end() ? it->second : std::string();
}

const char* status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        default:  return "Unknown";
    }
}

} // namespace swiv
