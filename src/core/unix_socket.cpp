#include "unix_socket.hpp"

#include <fcntl.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

namespace slc {
namespace {
void throw_errno(int err, const char* what) {
    throw std::system_error(err, std::generic_category(), what);
}
}  // namespace

UnixSocket UnixSocket::open_datagram() {
    int fd = ::socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) throw_errno(errno, "socket");
    return UnixSocket(fd);
}

void UnixSocket::set_nonblocking() {
    int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) != 0) throw_errno(errno, "fcntl");
}

int UnixSocket::connect(const std::string& path) {
    sockaddr_un sa{};
    sa.sun_family = AF_UNIX;
    if (path.size() >= sizeof(sa.sun_path)) return ENAMETOOLONG;
    std::memcpy(sa.sun_path, path.c_str(), path.size() + 1);
    if (::connect(fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) < 0) return errno;
    return 0;
}

bool UnixSocket::wait_writable(int timeout_ms) {
    if (fd_ < 0 || fd_ >= FD_SETSIZE) throw_errno(EBADF, "select");
    fd_set wfds;
    FD_ZERO(&wfds);
    FD_SET(fd_, &wfds);
    timeval tv{};
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    int rc = ::select(fd_ + 1, nullptr, &wfds, nullptr, &tv);
    if (rc < 0) throw_errno(errno, "select");
    return rc > 0;
}

int UnixSocket::pending_error() {
    int err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &len) < 0) throw_errno(errno, "getsockopt");
    return err;
}

void UnixSocket::reset(int fd) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
}
}  // namespace slc
