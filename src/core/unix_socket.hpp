#pragma once
#include <string>

namespace slc {
// The connect and readiness steps of a socket health check.
class DatagramChannel {
   public:
    virtual ~DatagramChannel() = default;
    // Returns 0 or the errno of the failed connect (EINPROGRESS included).
    virtual int connect(const std::string& path) = 0;
    // Waits for the write set only. False on timeout; throws on failure.
    virtual bool wait_writable(int timeout_ms) = 0;
    // Pending socket error, clearing it.
    virtual int pending_error() = 0;
};

// Owns one AF_UNIX descriptor; closed when the object goes out of scope.
class UnixSocket : public DatagramChannel {
   public:
    UnixSocket() : fd_(-1) {}
    explicit UnixSocket(int fd) : fd_(fd) {}
    ~UnixSocket() override {
        reset();
    }
    UnixSocket(const UnixSocket&) = delete;
    UnixSocket& operator=(const UnixSocket&) = delete;
    UnixSocket(UnixSocket&& o) noexcept : fd_(o.fd_) {
        o.fd_ = -1;
    }
    UnixSocket& operator=(UnixSocket&& o) noexcept {
        if (this != &o) {
            reset();
            fd_ = o.fd_;
            o.fd_ = -1;
        }
        return *this;
    }

    // Throws std::system_error if the descriptor cannot be created.
    static UnixSocket open_datagram();

    void set_nonblocking();
    int connect(const std::string& path) override;
    // select(2) on the write set; throws std::system_error on failure.
    bool wait_writable(int timeout_ms) override;
    // SO_ERROR of the socket.
    int pending_error() override;

    int get() const {
        return fd_;
    }
    void reset(int fd = -1);
    explicit operator bool() const {
        return fd_ >= 0;
    }

   private:
    int fd_;
};
}  // namespace slc
