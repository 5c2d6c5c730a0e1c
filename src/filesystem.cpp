#include "filesystem.hpp"
#include "errors.hpp"
#include "path_utils.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <sys/stat.h>

namespace swiv {

static std::string basename_of(const std::string& pathname) {
    std::string p = pathname;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    auto slash = p.rfind('/');
    if (slash == std::string::npos || p.size() == 1) return p;
    return p.substr(slash + 1);
}

std::string Directory::basename() const {
    return basename_of(pathname);
}

std::string File::basename() const {
    return basename_of(pathname);
}

std::optional<Entry> classify(const std::string& pathname) {
    struct stat st {};
    if (::stat(pathname.c_str(), &st) != 0) {
        return std::nullopt;
    }
    if (S_ISDIR(st.st_mode)) return Entry{Directory{pathname}};
    if (S_ISREG(st.st_mode)) return Entry{File{pathname}};
    return std::nullopt;
}

std::vector<Entry> list_children(const std::string& pathname) {
    DIR* dir = ::opendir(pathname.c_str());
    if (!dir) {
        throw FilesystemError("Could not scan directory: " + pathname + " (" +
                              std::strerror(errno) + ")");
    }

    std::vector<std::string> names;
    errno = 0;
    while (dirent* ent = ::readdir(dir)) {
        std::string name = ent->d_name;
        if (name != "." && name != "..") {
            names.push_back(std::move(name));
        }
        errno = 0;
    }
    int read_errno = errno;
    ::closedir(dir);

    if (read_errno != 0) {
        throw FilesystemError("Could not scan directory: " + pathname + " (" +
                              std::strerror(read_errno) + ")");
    }

    std::sort(names.begin(), names.end());

    std::vector<Entry> children;
    children.reserve(names.size());
    for (const auto& name : names) {
        if (auto entry = classify(join(pathname, name))) {
            children.push_back(std::move(*entry));
        }
    }
    return children;
}

const std::string& pathname_of(const Entry& entry) {
    return std::visit([](const auto& e) -> const std::string& { return e.pathname; }, entry);
}

} // namespace swiv
