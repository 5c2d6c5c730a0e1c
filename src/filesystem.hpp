#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace swiv {

struct Directory {
    std::string pathname;

    std::string basename() const;
};

struct File {
    std::string pathname;

    std::string basename() const;
};

// A classified filesystem node. Absent is an empty optional.
using Entry = std::variant<Directory, File>;

// Directory first, then regular file. Missing, unreadable or special nodes
// (sockets, devices, dangling symlinks) are Absent. Never throws.
std::optional<Entry> classify(const std::string& pathname);

// Immediate children of `pathname`, without "." and "..", classified, Absent
// ones dropped. Sorted by name (ordinal).
// Throws FilesystemError if the directory cannot be scanned.
std::vector<Entry> list_children(const std::string& pathname);

const std::string& pathname_of(const Entry& entry);

} // namespace swiv
