#include "network/socket.hpp"
#include "util/logger.hpp"

#include <arpa/inet.h>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <string>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace veilchat {
namespace network {

namespace {

using Clock = std::chrono::steady_clock;

int remainingMs(Clock::time_point deadline)
{
    auto left = std::chrono::duration_cast<Millis>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

/// poll() a single descriptor until deadline. Returns false on timeout.
bool waitFor(int fd, short events, Clock::time_point deadline)
{
    for (;;) {
        pollfd pfd;
        pfd.fd = fd;
        pfd.events = events;
        pfd.revents = 0;
        int rc = ::poll(&pfd, 1, remainingMs(deadline));
        if (rc > 0) {
            return true;
        }
        if (rc == 0) {
            return false;
        }
        if (errno != EINTR) {
            int err = errno;
            throw MessengerError(ErrorKind::ConnectionFailed,
                                 std::string("poll failed: ") + std::strerror(err),
                                 ConnectCause::Other);
        }
    }
}

MessengerError socketFailure(int err, const std::string &what)
{
    if (err == ETIMEDOUT) {
        return MessengerError(ErrorKind::Timeout, what + ": connection timeout");
    }
    ConnectCause cause = classifyErrno(err);
    return MessengerError(ErrorKind::ConnectionFailed,
                          what + ": " + causeText(cause) + " (" + std::strerror(err) + ")",
                          cause);
}

bool setNonBlocking(int fd, bool enabled)
{
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return ::fcntl(fd, F_SETFL, flags) == 0;
}

bool parseIpv4(const std::string &ip, in_addr &out)
{
    return ::inet_pton(AF_INET, ip.c_str(), &out) == 1;
}

std::string formatEndpoint(const sockaddr_in &addr)
{
    char ipStr[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, &addr.sin_addr, ipStr, INET_ADDRSTRLEN);
    return std::string(ipStr) + ":" + std::to_string(ntohs(addr.sin_port));
}

uint16_t boundPort(int fd)
{
    sockaddr_in addr;
    socklen_t len = sizeof(addr);
    std::memset(&addr, 0, sizeof(addr));
    if (::getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

} // namespace

ConnectCause classifyErrno(int err)
{
    switch (err) {
    case ECONNREFUSED:
        return ConnectCause::Refused;
    case EHOSTUNREACH:
    case ENETUNREACH:
    case EHOSTDOWN:
    case ENETDOWN:
        return ConnectCause::Unreachable;
    case ECONNRESET:
    case EPIPE:
    case ECONNABORTED:
        return ConnectCause::Closed;
    default:
        return ConnectCause::Other;
    }
}

const char *causeText(ConnectCause cause)
{
    switch (cause) {
    case ConnectCause::None:
        return "no error";
    case ConnectCause::Refused:
        return "connection refused";
    case ConnectCause::Unreachable:
        return "host unreachable";
    case ConnectCause::Resolve:
        return "address resolution failed";
    case ConnectCause::Closed:
        return "connection closed";
    case ConnectCause::Other:
        return "connection failed";
    }
    return "connection failed";
}

HostPort splitHostPort(const std::string &address)
{
    HostPort hp{address, 0};
    std::string portText;
    if (!address.empty() && address.front() == '[') {
        auto close = address.find(']');
        if (close == std::string::npos) {
            return hp;
        }
        hp.host = address.substr(1, close - 1);
        if (close + 1 >= address.size() || address[close + 1] != ':') {
            return hp;
        }
        portText = address.substr(close + 2);
    }
    else {
        auto colon = address.find(':');
        if (colon == std::string::npos || address.find(':', colon + 1) != std::string::npos) {
            // no port, or an unbracketed IPv6 literal
            return hp;
        }
        hp.host = address.substr(0, colon);
        portText = address.substr(colon + 1);
    }

    if (portText.empty() || !std::isdigit(static_cast<unsigned char>(portText.front()))) {
        return hp;
    }
    try {
        size_t idx = 0;
        unsigned long value = std::stoul(portText, &idx, 10);
        if (idx == portText.size() && value > 0 && value <= 65535) {
            hp.port = static_cast<uint16_t>(value);
        }
    }
    catch (const std::exception &) {
        hp.port = 0;
    }
    return hp;
}

std::string joinHostPort(const std::string &host, uint16_t port)
{
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

// ---------------------------------------------------------------------------
// TcpSocket
// ---------------------------------------------------------------------------

TcpSocket::TcpSocket(int fd, std::string peerAddress)
    : fd_(fd)
    , peerAddress_(std::move(peerAddress))
{
}

TcpSocket::~TcpSocket()
{
    close();
}

TcpSocket::TcpSocket(TcpSocket &&other) noexcept
    : fd_(other.fd_)
    , peerAddress_(std::move(other.peerAddress_))
{
    other.fd_ = -1;
}

TcpSocket &TcpSocket::operator=(TcpSocket &&other) noexcept
{
    if (this != &other) {
        close();
        fd_ = other.fd_;
        peerAddress_ = std::move(other.peerAddress_);
        other.fd_ = -1;
    }
    return *this;
}

TcpSocket TcpSocket::connectTo(const std::string &host, uint16_t port, Millis timeout)
{
    const std::string endpoint = joinHostPort(host, port);

    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *result = nullptr;
    int rc = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &result);
    if (rc != 0 || result == nullptr) {
        throw MessengerError(ErrorKind::ConnectionFailed,
                             "connect to " + endpoint + ": address resolution failed (" +
                                 ::gai_strerror(rc) + ")",
                             ConnectCause::Resolve);
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(result, &::freeaddrinfo);

    int fd = ::socket(result->ai_family, SOCK_STREAM, 0);
    if (fd < 0) {
        throw socketFailure(errno, "connect to " + endpoint);
    }
    TcpSocket sock(fd, endpoint);

    if (!setNonBlocking(fd, true)) {
        throw socketFailure(errno, "connect to " + endpoint);
    }

    auto deadline = Clock::now() + timeout;
    if (::connect(fd, result->ai_addr, result->ai_addrlen) < 0) {
        if (errno != EINPROGRESS) {
            throw socketFailure(errno, "connect to " + endpoint);
        }
        if (!waitFor(fd, POLLOUT, deadline)) {
            throw MessengerError(ErrorKind::Timeout, "connect to " + endpoint + ": connection timeout");
        }
        int soError = 0;
        socklen_t len = sizeof(soError);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) < 0) {
            throw socketFailure(errno, "connect to " + endpoint);
        }
        if (soError != 0) {
            throw socketFailure(soError, "connect to " + endpoint);
        }
    }

    if (!setNonBlocking(fd, false)) {
        throw socketFailure(errno, "connect to " + endpoint);
    }
    return sock;
}

void TcpSocket::sendAll(const uint8_t *data, size_t len, Millis timeout)
{
    if (fd_ < 0) {
        throw MessengerError(ErrorKind::ConnectionFailed, "write on closed socket",
                             ConnectCause::Closed);
    }
    auto deadline = Clock::now() + timeout;
    size_t sent = 0;
    while (sent < len) {
        if (!waitFor(fd_, POLLOUT, deadline)) {
            throw MessengerError(ErrorKind::Timeout, "write to " + peerAddress_ + " timed out");
        }
        ssize_t n = ::send(fd_, data + sent, len - sent, MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            throw socketFailure(errno, "write to " + peerAddress_);
        }
        sent += static_cast<size_t>(n);
    }
}

void TcpSocket::sendAll(const std::vector<uint8_t> &data, Millis timeout)
{
    sendAll(data.data(), data.size(), timeout);
}

void TcpSocket::readExact(uint8_t *buffer, size_t len, Millis timeout)
{
    if (fd_ < 0) {
        throw MessengerError(ErrorKind::ConnectionFailed, "read on closed socket",
                             ConnectCause::Closed);
    }
    auto deadline = Clock::now() + timeout;
    size_t got = 0;
    while (got < len) {
        if (!waitFor(fd_, POLLIN, deadline)) {
            throw MessengerError(ErrorKind::Timeout, "read from " + peerAddress_ + " timed out");
        }
        ssize_t n = ::recv(fd_, buffer + got, len - got, MSG_DONTWAIT);
        if (n == 0) {
            throw MessengerError(ErrorKind::ConnectionFailed,
                                 "connection closed by " + peerAddress_, ConnectCause::Closed);
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            throw socketFailure(errno, "read from " + peerAddress_);
        }
        got += static_cast<size_t>(n);
    }
}

std::vector<uint8_t> TcpSocket::readExact(size_t len, Millis timeout)
{
    std::vector<uint8_t> out(len);
    if (len > 0) {
        readExact(out.data(), len, timeout);
    }
    return out;
}

void TcpSocket::close()
{
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

// ---------------------------------------------------------------------------
// WakePipe
// ---------------------------------------------------------------------------

WakePipe::WakePipe()
{
    if (::pipe(fds_) < 0) {
        throw std::runtime_error(std::string("WakePipe: pipe() failed: ") + std::strerror(errno));
    }
    if (!setNonBlocking(fds_[1], true)) {
        int err = errno;
        ::close(fds_[0]);
        ::close(fds_[1]);
        throw std::runtime_error(std::string("WakePipe: fcntl() failed: ") + std::strerror(err));
    }
}

WakePipe::~WakePipe()
{
    for (int &fd : fds_) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
}

void WakePipe::notify()
{
    const uint8_t byte = 1;
    if (::write(fds_[1], &byte, 1) < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
        util::logger::warn(std::string("[WakePipe] notify failed: ") + std::strerror(errno));
    }
}

// ---------------------------------------------------------------------------
// TcpListener
// ---------------------------------------------------------------------------

TcpListener::~TcpListener()
{
    close();
}

void TcpListener::bindAndListen(const std::string &address, uint16_t port, int backlog)
{
    const std::string endpoint = address + ":" + std::to_string(port);

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (!parseIpv4(address, addr.sin_addr)) {
        throw MessengerError(ErrorKind::ConnectionFailed, "invalid bind address " + address,
                             ConnectCause::Resolve);
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw socketFailure(errno, "bind " + endpoint);
    }

    int optval = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(fd);
        throw MessengerError(ErrorKind::ConnectionFailed,
                             "failed to bind " + endpoint + ": " + std::strerror(err),
                             classifyErrno(err));
    }
    if (::listen(fd, backlog) < 0) {
        int err = errno;
        ::close(fd);
        throw MessengerError(ErrorKind::ConnectionFailed,
                             "failed to listen on " + endpoint + ": " + std::strerror(err),
                             classifyErrno(err));
    }

    close();
    fd_ = fd;
    port_ = boundPort(fd);
}

std::optional<TcpSocket> TcpListener::accept(const WakePipe &wake)
{
    while (fd_ >= 0) {
        pollfd fds[2];
        fds[0].fd = fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wake.readFd();
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw socketFailure(errno, "accept");
        }
        if (fds[1].revents != 0) {
            return std::nullopt;
        }
        if ((fds[0].revents & POLLIN) == 0) {
            continue;
        }

        sockaddr_in clientAddr;
        socklen_t clientLen = sizeof(clientAddr);
        std::memset(&clientAddr, 0, sizeof(clientAddr));
        int clientFd = ::accept(fd_, reinterpret_cast<sockaddr *>(&clientAddr), &clientLen);
        if (clientFd < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK ||
                errno == ECONNABORTED) {
                continue;
            }
            throw socketFailure(errno, "accept");
        }
        return TcpSocket(clientFd, formatEndpoint(clientAddr));
    }
    return std::nullopt;
}

void TcpListener::close()
{
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

// ---------------------------------------------------------------------------
// UdpSocket
// ---------------------------------------------------------------------------

UdpSocket::~UdpSocket()
{
    close();
}

UdpSocket::UdpSocket(UdpSocket &&other) noexcept
    : fd_(other.fd_)
    , port_(other.port_)
{
    other.fd_ = -1;
}

UdpSocket &UdpSocket::operator=(UdpSocket &&other) noexcept
{
    if (this != &other) {
        close();
        fd_ = other.fd_;
        port_ = other.port_;
        other.fd_ = -1;
    }
    return *this;
}

void UdpSocket::open(bool reuse)
{
    close();
    fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) {
        throw socketFailure(errno, "udp socket");
    }
    if (reuse) {
        int optval = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));
#ifdef SO_REUSEPORT
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEPORT, &optval, sizeof(optval));
#endif
    }
}

void UdpSocket::bind(const std::string &address, uint16_t port)
{
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (!parseIpv4(address, addr.sin_addr)) {
        throw MessengerError(ErrorKind::ConnectionFailed, "invalid bind address " + address,
                             ConnectCause::Resolve);
    }
    if (::bind(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        throw MessengerError(ErrorKind::ConnectionFailed,
                             "failed to bind udp " + address + ":" + std::to_string(port) + ": " +
                                 std::strerror(err),
                             classifyErrno(err));
    }
    port_ = boundPort(fd_);
}

void UdpSocket::enableBroadcast()
{
    int optval = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &optval, sizeof(optval)) < 0) {
        throw socketFailure(errno, "enable broadcast");
    }
}

bool UdpSocket::sendTo(const std::string &ip, uint16_t port, const std::vector<uint8_t> &data)
{
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (fd_ < 0 || !parseIpv4(ip, addr.sin_addr)) {
        return false;
    }
    ssize_t n = ::sendto(fd_, data.data(), data.size(), 0,
                         reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
    return n == static_cast<ssize_t>(data.size());
}

std::optional<Datagram> UdpSocket::receive(Millis timeout, size_t maxSize)
{
    if (fd_ < 0) {
        return std::nullopt;
    }
    if (!waitFor(fd_, POLLIN, Clock::now() + timeout)) {
        return std::nullopt;
    }

    std::vector<uint8_t> buffer(maxSize);
    sockaddr_in from;
    socklen_t fromLen = sizeof(from);
    std::memset(&from, 0, sizeof(from));
    ssize_t n = ::recvfrom(fd_, buffer.data(), buffer.size(), MSG_DONTWAIT,
                           reinterpret_cast<sockaddr *>(&from), &fromLen);
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
            return std::nullopt;
        }
        throw socketFailure(errno, "udp receive");
    }
    buffer.resize(static_cast<size_t>(n));

    char ipStr[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, &from.sin_addr, ipStr, INET_ADDRSTRLEN);

    Datagram dg;
    dg.data = std::move(buffer);
    dg.fromIp = ipStr;
    dg.fromPort = ntohs(from.sin_port);
    return dg;
}

void UdpSocket::close()
{
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace network
} // namespace veilchat
