#include "http_parser.hpp"
#include "path_utils.hpp"
#include <sstream>

namespace swiv {

static std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

std::unordered_map<std::string, std::string> parse_query(const std::string& query) {
    std::unordered_map<std::string, std::string> params;
    size_t pos = 0;
    while (pos <= query.size()) {
        auto amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();

        std::string pair = query.substr(pos, amp - pos);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            std::string key = pair.substr(0, eq);
            std::string value = eq == std::string::npos ? "" : pair.substr(eq + 1);
            params[url_decode(key, true)] = url_decode(value, true);
        }
        pos = amp + 1;
    }
    return params;
}

std::optional<Request> parse_request(const std::string& head) {
    auto line_end = head.find("\r\n");
    std::string request_line = head.substr(0, line_end);

    // "GET /path HTTP/1.1"
    std::istringstream first(request_line);
    std::string method, target, version;
    if (!(first >> method >> target >> version)) {
        return std::nullopt;
    }
    std::string extra;
    if (first >> extra) return std::nullopt;
    if (version.compare(0, 5, "HTTP/") != 0) return std::nullopt;
    if (target.empty() || target.front() != '/') return std::nullopt;

    std::string raw_query;
    auto q = target.find('?');
    if (q != std::string::npos) {
        raw_query = target.substr(q + 1);
        target = target.substr(0, q);
    }

    std::unordered_map<std::string, std::string> headers;
    size_t pos = line_end == std::string::npos ? head.size() : line_end + 2;
    while (pos < head.size()) {
        auto eol = head.find("\r\n", pos);
        if (eol == std::string::npos) eol = head.size();

        std::string line = head.substr(pos, eol - pos);
        pos = eol + 2;
        if (line.empty()) break;

        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return std::nullopt;
        }
        headers[line.substr(0, colon)] = trim(line.substr(colon + 1));
    }

    return Request(method, url_decode(target), parse_query(raw_query), std::move(headers));
}

} // namespace swiv
