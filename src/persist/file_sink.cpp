#include "persist/file_sink.hpp"

#include <cerrno>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/uio.h>
#include <unistd.h>

namespace persist {

PosixFileSink::PosixFileSink() = default;
PosixFileSink::~PosixFileSink() { close(); }

IoResult PosixFileSink::open(const std::string& path) noexcept {
    close();
    const int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return {false, errno};
    }
    fd_ = fd;
    size_bytes_ = 0;
    return {true, 0};
}

IoResult PosixFileSink::close() noexcept {
    if (fd_ < 0) {
        return {true, 0};
    }
    const int ret = ::close(fd_);
    fd_ = -1;
    if (ret != 0) {
        return {false, errno};
    }
    return {true, 0};
}

IoResult PosixFileSink::writev(const struct iovec* iov, int iovcnt, std::size_t& bytes_written) noexcept {
    bytes_written = 0;
    if (fd_ < 0) {
        return {false, EBADF};
    }
    ssize_t ret = ::writev(fd_, iov, iovcnt);
    while (ret < 0 && errno == EINTR) {
        ret = ::writev(fd_, iov, iovcnt);
    }
    if (ret < 0) {
        return {false, errno};
    }
    bytes_written = static_cast<std::size_t>(ret);
    size_bytes_ += static_cast<std::uint64_t>(ret);
    return {true, 0};
}

bool PosixFileSink::is_open() const noexcept { return fd_ >= 0; }

} // namespace persist
