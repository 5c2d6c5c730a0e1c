#pragma once

#include "filesystem.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace swiv {

// Pull-based byte-chunk sequence over one file.
//
// The stream exclusively owns the descriptor. It is released exactly once:
// when next() reaches end of file, on close(), or when the stream is
// destroyed, so a consumer that stops pulling (client went away) leaks nothing.
class FileStream {
public:
    static constexpr size_t chunk_size = 4096;

    // Throws FileOpenError when the file cannot be opened
    static FileStream open(const File& file);

    ~FileStream();

    FileStream(FileStream&& other) noexcept;
    FileStream& operator=(FileStream&& other) noexcept;

    // Non-copyable
    FileStream(const FileStream&) = delete;
    FileStream& operator=(const FileStream&) = delete;

    // Read the next chunk (at most chunk_size bytes, never padded).
    // Returns false once the file is exhausted. Throws FileReadError.
    bool next(std::string& chunk);

    void close();

    bool is_open() const { return fd_ >= 0; }
    const std::string& pathname() const { return pathname_; }

    // Size reported by fstat when the file was opened
    uint64_t size() const { return size_; }

private:
    FileStream(int fd, std::string pathname, uint64_t size);

    int fd_ = -1;
    std::string pathname_;
    uint64_t size_ = 0;
};

} // namespace swiv
