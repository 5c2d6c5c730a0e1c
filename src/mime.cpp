#include "mime.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace swiv {

static const char* const default_type = "application/octet-stream";

const std::unordered_map<std::string, std::string> MimeDetector::mime_types_ = {
    {".html", "text/html"},
    {".css",  "text/css"},
    {".js",   "application/javascript"},
    {".json", "application/json"},
    {".txt",  "text/plain"},
    {".png",  "image/png"},
    {".jpg",  "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif",  "image/gif"},
    {".webp", "image/webp"},
    {".avif", "image/avif"},
    {".bmp",  "image/bmp"},
    {".svg",  "image/svg+xml"},
    {".ico",  "image/x-icon"},
    {".mp4",  "video/mp4"},
    {".webm", "video/webm"},
};

MimeDetector::MimeDetector() {
    cookie_ = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
    if (!cookie_) {
        spdlog::warn("MIME: magic_open failed, falling back to extensions");
        return;
    }

    if (magic_load(cookie_, nullptr) != 0) {
        spdlog::warn("MIME: Failed to load magic database: {}", magic_error(cookie_));
        magic_close(cookie_);
        cookie_ = nullptr;
    }
}

MimeDetector::~MimeDetector() {
    if (cookie_) {
        magic_close(cookie_);
    }
}

std::string MimeDetector::mimetype(const File& file) const {
    if (cookie_) {
        const char* type = nullptr;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            type = magic_file(cookie_, file.pathname.c_str());
            if (type && *type) {
                return type;
            }
        }
        spdlog::debug("MIME: No magic match for {}", file.pathname);
    }

    std::string by_ext = from_extension(file.pathname);
    return by_ext.empty() ? default_type : by_ext;
}

std::string MimeDetector::from_extension(const std::string& pathname) {
    auto slash = pathname.rfind('/');
    auto dot = pathname.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "";
    }

    std::string ext = pathname.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = mime_types_.find(ext);
    if (it != mime_types_.end()) {
        return it->second;
    }
    return "";
}

} // namespace swiv
