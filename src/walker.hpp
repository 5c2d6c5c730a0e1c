#pragma once

#include "filesystem.hpp"
#include <cstddef>
#include <set>
#include <utility>
#include <vector>
#include <sys/types.h>

namespace swiv {

// Depth-first cursor over every File below a directory.
//
// Children are visited in listing order; a subdirectory is fully drained
// before its next sibling. Directories themselves are never yielded. Nothing
// is cached: each Walker lists the tree afresh, one directory at a time, as
// next() is pulled.
class Walker {
public:
    // Deeper than this is treated as a cycle
    static constexpr size_t max_depth = 64;

    explicit Walker(const Directory& root);

    // Throws FilesystemError or CycleDetected
    bool next(File& out);

private:
    using DirId = std::pair<dev_t, ino_t>;

    struct Frame {
        std::vector<Entry> children;
        size_t index = 0;
        DirId id;
    };

    void descend(const Directory& dir);

    std::vector<Frame> stack_;
    std::set<DirId> on_path_;
};

// Drain a walk and sort the files by pathname (byte-wise)
std::vector<File> collect_files(const Directory& dir);

} // namespace swiv
