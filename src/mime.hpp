#pragma once

#include "filesystem.hpp"
#include <magic.h>
#include <mutex>
#include <string>
#include <unordered_map>

namespace swiv {

// Content-type detection backed by libmagic, with an extension table for
// when libmagic has no answer. A libmagic cookie is not thread-safe, so
// lookups are serialized.
class MimeDetector {
public:
    MimeDetector();
    ~MimeDetector();

    // Non-copyable
    MimeDetector(const MimeDetector&) = delete;
    MimeDetector& operator=(const MimeDetector&) = delete;

    // Never empty; "application/octet-stream" when nothing matches
    std::string mimetype(const File& file) const;

    bool has_magic() const { return cookie_ != nullptr; }

    static std::string from_extension(const std::string& pathname);

private:
    magic_t cookie_ = nullptr;
    mutable std::mutex mutex_;

    static const std::unordered_map<std::string, std::string> mime_types_;
};

} // namespace swiv
