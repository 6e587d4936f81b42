#pragma once
#include <sys/socket.h>
#include <unistd.h>

namespace wcl {
// Owning wrapper for a socket descriptor; closes on scope exit.
class Fd {
   public:
    Fd() : fd_(-1) {}
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() {
        reset();
    }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    Fd(Fd&& o) noexcept : fd_(o.fd_) {
        o.fd_ = -1;
    }
    Fd& operator=(Fd&& o) noexcept {
        if (this != &o) {
            reset();
            fd_ = o.fd_;
            o.fd_ = -1;
        }
        return *this;
    }

    static Fd open_socket(int domain, int type, int protocol = 0) {
        return Fd(::socket(domain, type | SOCK_CLOEXEC, protocol));
    }

    int get() const {
        return fd_;
    }
    void reset(int fd = -1) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }
    explicit operator bool() const {
        return fd_ >= 0;
    }

   private:
    int fd_;
};
}  // namespace wcl
