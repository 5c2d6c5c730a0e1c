#include "file_stream.hpp"
#include "errors.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace swiv {

FileStream FileStream::open(const File& file) {
    int fd = ::open(file.pathname.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw FileOpenError("Could not read file: " + file.pathname + " (" +
                            std::strerror(errno) + ")");
    }

    struct stat st {};
    uint64_t size = 0;
    if (::fstat(fd, &st) == 0) {
        size = static_cast<uint64_t>(st.st_size);
    }
    return FileStream(fd, file.pathname, size);
}

FileStream::FileStream(int fd, std::string pathname, uint64_t size)
    : fd_(fd)
    , pathname_(std::move(pathname))
    , size_(size)
{
}

FileStream::~FileStream() {
    close();
}

FileStream::FileStream(FileStream&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , pathname_(std::move(other.pathname_))
    , size_(other.size_)
{
}

FileStream& FileStream::operator=(FileStream&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
        pathname_ = std::move(other.pathname_);
        size_ = other.size_;
    }
    return *this;
}

bool FileStream::next(std::string& chunk) {
    if (fd_ < 0) return false;

    chunk.resize(chunk_size);
    ssize_t n;
    do {
        n = ::read(fd_, &chunk[0], chunk_size);
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        int err = errno;
        chunk.clear();
        close();
        throw FileReadError("Read failed: " + pathname_ + " (" + std::strerror(err) + ")");
    }

    if (n == 0) {
        chunk.clear();
        close();
        return false;
    }

    chunk.resize(static_cast<size_t>(n));
    return true;
}

void FileStream::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace swiv
