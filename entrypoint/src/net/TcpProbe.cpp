#include "net/TcpProbe.h"

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace bootgate::entrypoint::net {
namespace {
constexpr int kInvalidSocket = -1;

class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ != kInvalidSocket) {
            ::close(fd_);
        }
    }

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

// Returns 0 on success or the errno value of the failed connect.
int connectWithTimeout(const addrinfo& address, int timeoutSeconds) {
    SocketGuard sock(::socket(address.ai_family, address.ai_socktype | SOCK_CLOEXEC, address.ai_protocol));
    if (sock.get() == kInvalidSocket) {
        return errno;
    }

    if (timeoutSeconds <= 0) {
        return ::connect(sock.get(), address.ai_addr, address.ai_addrlen) == 0 ? 0 : errno;
    }

    int flags = ::fcntl(sock.get(), F_GETFL, 0);
    if (flags < 0 || ::fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
        return errno;
    }

    if (::connect(sock.get(), address.ai_addr, address.ai_addrlen) == 0) {
        return 0;
    }
    if (errno != EINPROGRESS) {
        return errno;
    }

    pollfd pfd{};
    pfd.fd = sock.get();
    pfd.events = POLLOUT;
    int rc;
    do {
        rc = ::poll(&pfd, 1, timeoutSeconds * 1000);
    } while (rc < 0 && errno == EINTR);
    if (rc < 0) {
        return errno;
    }
    if (rc == 0) {
        return ETIMEDOUT;
    }

    int socketError = 0;
    socklen_t length = sizeof(socketError);
    if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &socketError, &length) < 0) {
        return errno;
    }
    return socketError;
}

}  // namespace

TcpProbe::TcpProbe(std::string host, int port, int timeoutSeconds)
    : host_(std::move(host)), port_(port), timeoutSeconds_(timeoutSeconds) {}

db::ProbeResult TcpProbe::probe() {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    int rc = ::getaddrinfo(host_.c_str(), std::to_string(port_).c_str(), &hints, &result);
    if (rc != 0 || result == nullptr) {
        return {false, "Failed to resolve " + host_ + ": " + std::string(gai_strerror(rc))};
    }

    int lastError = ECONNREFUSED;
    bool connected = false;
    for (addrinfo* rp = result; rp != nullptr; rp = rp->ai_next) {
        lastError = connectWithTimeout(*rp, timeoutSeconds_);
        if (lastError == 0) {
            connected = true;
            break;
        }
    }

    ::freeaddrinfo(result);

    if (!connected) {
        return {false, "Failed to connect to " + host_ + ":" + std::to_string(port_) + ": " +
                           std::strerror(lastError)};
    }
    return {true, {}};
}

}  // namespace bootgate::entrypoint::net
