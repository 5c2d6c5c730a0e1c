#include "path_utils.hpp"

namespace swiv {

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::string relative_to(const std::string& base, const std::string& pathname) {
    if (starts_with(pathname, base)) {
        return pathname.substr(base.size());
    }
    return pathname;
}

std::string join(const std::string& a, const std::string& b) {
    bool a_sep = !a.empty() && a.back() == '/';
    bool b_sep = !b.empty() && b.front() == '/';

    if (a_sep && b_sep) return a + b.substr(1);
    if (a_sep || b_sep) return a + b;
    return a + "/" + b;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(const std::string& s, bool plus_as_space) {
    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (c == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        if (c == '+' && plus_as_space) {
            out.push_back(' ');
            continue;
        }
        out.push_back(c);
    }
    return out;
}

std::string url_encode_path(const std::string& path) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(path.size());

    for (unsigned char c : path) {
        bool alnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
        if (alnum || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

bool is_within(const std::string& base, const std::string& path) {
    if (!starts_with(path, base)) return false;
    if (path.size() == base.size()) return true;
    // "/srv/a" must not accept "/srv/ab"
    return (!base.empty() && base.back() == '/') || path[base.size()] == '/';
}

} // namespace swiv
