#include "walker.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>

namespace swiv {

Walker::Walker(const Directory& root) {
    descend(root);
}

void Walker::descend(const Directory& dir) {
    struct stat st {};
    if (::stat(dir.pathname.c_str(), &st) != 0) {
        throw FilesystemError("Could not stat directory: " + dir.pathname + " (" +
                              std::strerror(errno) + ")");
    }

    DirId id{st.st_dev, st.st_ino};
    if (on_path_.count(id)) {
        throw CycleDetected("Directory cycle at " + dir.pathname);
    }
    if (stack_.size() >= max_depth) {
        throw CycleDetected("Directory nesting deeper than " +
                            std::to_string(max_depth) + " at " + dir.pathname);
    }

    Frame frame;
    frame.children = list_children(dir.pathname);
    frame.id = id;

    on_path_.insert(id);
    stack_.push_back(std::move(frame));
}

bool Walker::next(File& out) {
    while (!stack_.empty()) {
        Frame& top = stack_.back();

        if (top.index >= top.children.size()) {
            on_path_.erase(top.id);
            stack_.pop_back();
            continue;
        }

        Entry& entry = top.children[top.index++];
        if (auto* file = std::get_if<File>(&entry)) {
            out = *file;
            return true;
        }

        // `top` is invalidated by the push in descend()
        Directory sub = std::get<Directory>(entry);
        descend(sub);
    }
    return false;
}

std::vector<File> collect_files(const Directory& dir) {
    std::vector<File> files;
    Walker walker(dir);
    File file;
    while (walker.next(file)) {
        files.push_back(file);
    }

    std::sort(files.begin(), files.end(),
              [](const File& a, const File& b) { return a.pathname < b.pathname; });
    return files;
}

} // namespace swiv
