#ifndef notevault_CORE_SCOPED_FD_HPP
#define notevault_CORE_SCOPED_FD_HPP

#include <unistd.h>

namespace notevault {

// Owns a POSIX file descriptor and closes it on scope exit.
class ScopedFd {
public:
    ScopedFd() : fd_(-1) {}
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() { reset(); }

    ScopedFd(ScopedFd&& other) noexcept : fd_(other.release()) {}
    ScopedFd& operator=(ScopedFd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

    // Close now and report the result (a failed close after write can mean
    // lost data).
    int close() {
        int fd = release();
        return fd >= 0 ? ::close(fd) : 0;
    }

private:
    ScopedFd(const ScopedFd&);
    ScopedFd& operator=(const ScopedFd&);

    int fd_;
};

} // namespace notevault

#endif // notevault_CORE_SCOPED_FD_HPP
