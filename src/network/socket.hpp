#ifndef VEILCHAT_NETWORK_SOCKET_HPP
#define VEILCHAT_NETWORK_SOCKET_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"

namespace veilchat {
namespace network {

/*
  socket.hpp
  --------------------------------
  Thin RAII wrappers over POSIX sockets used by the delivery manager, the
  masking layer and discovery.

   - TcpSocket    connected stream socket; connect/read/write all take a
                  timeout and throw MessengerError (Timeout or
                  ConnectionFailed with a ConnectCause).
   - TcpListener  bound listening socket; accept() can be interrupted
                  through a WakePipe.
   - WakePipe     self-pipe used to wake a poll() loop from another thread.
   - UdpSocket    datagram socket for discovery announcements.
*/

using Millis = std::chrono::milliseconds;

/// Map an errno value from connect()/send()/recv() to a ConnectCause.
ConnectCause classifyErrno(int err);

/// Human readable text for a cause, used in error messages and events.
const char *causeText(ConnectCause cause);

struct HostPort
{
    std::string host;
    uint16_t port = 0; ///< 0 when missing or not a valid port
};

/// Split "host:port". A bracketed IPv6 host ("[::1]:8080") loses its brackets.
HostPort splitHostPort(const std::string &address);

/// Inverse of splitHostPort(); IPv6 hosts are bracketed.
std::string joinHostPort(const std::string &host, uint16_t port);

class TcpSocket
{
public:
    TcpSocket() = default;
    TcpSocket(int fd, std::string peerAddress);
    ~TcpSocket();

    TcpSocket(TcpSocket &&other) noexcept;
    TcpSocket &operator=(TcpSocket &&other) noexcept;
    TcpSocket(const TcpSocket &) = delete;
    TcpSocket &operator=(const TcpSocket &) = delete;

    /**
     * @brief Resolve host and connect within timeout.
     * @throw MessengerError Timeout when the connect does not complete in
     *        time, ConnectionFailed (Resolve/Refused/Unreachable/Other)
     *        otherwise.
     */
    static TcpSocket connectTo(const std::string &host, uint16_t port, Millis timeout);

    /// Write every byte or throw; the timeout bounds the whole write.
    void sendAll(const uint8_t *data, size_t len, Millis timeout);
    void sendAll(const std::vector<uint8_t> &data, Millis timeout);

    /**
     * @brief Read exactly len bytes; the timeout bounds the whole read.
     * @throw MessengerError Timeout, or ConnectionFailed/Closed on EOF.
     */
    void readExact(uint8_t *buffer, size_t len, Millis timeout);
    std::vector<uint8_t> readExact(size_t len, Millis timeout);

    void close();
    bool isOpen() const { return fd_ >= 0; }
    int fd() const { return fd_; }
    const std::string &peerAddress() const { return peerAddress_; }

private:
    int fd_ = -1;
    std::string peerAddress_;
};

class WakePipe
{
public:
    WakePipe();
    ~WakePipe();
    WakePipe(const WakePipe &) = delete;
    WakePipe &operator=(const WakePipe &) = delete;

    void notify();
    int readFd() const { return fds_[0]; }

private:
    int fds_[2] = {-1, -1};
};

class TcpListener
{
public:
    TcpListener() = default;
    ~TcpListener();
    TcpListener(const TcpListener &) = delete;
    TcpListener &operator=(const TcpListener &) = delete;

    /**
     * @brief Bind and listen. Port 0 picks an ephemeral port, see port().
     * @throw MessengerError ConnectionFailed if the address cannot be bound.
     */
    void bindAndListen(const std::string &address, uint16_t port, int backlog = 64);

    /**
     * @brief Wait for the next connection or a wake-up on wake.
     * @return std::nullopt if woken (or the listener is closed).
     */
    std::optional<TcpSocket> accept(const WakePipe &wake);

    void close();
    bool isOpen() const { return fd_ >= 0; }
    uint16_t port() const { return port_; }

private:
    int fd_ = -1;
    uint16_t port_ = 0;
};

struct Datagram
{
    std::vector<uint8_t> data;
    std::string fromIp;
    uint16_t fromPort = 0;
};

class UdpSocket
{
public:
    UdpSocket() = default;
    ~UdpSocket();
    UdpSocket(UdpSocket &&other) noexcept;
    UdpSocket &operator=(UdpSocket &&other) noexcept;
    UdpSocket(const UdpSocket &) = delete;
    UdpSocket &operator=(const UdpSocket &) = delete;

    /// Create the socket; with reuse set, SO_REUSEADDR/SO_REUSEPORT are enabled.
    void open(bool reuse);
    void bind(const std::string &address, uint16_t port);
    void enableBroadcast();

    /// @return false when the datagram could not be sent (logged by the caller).
    bool sendTo(const std::string &ip, uint16_t port, const std::vector<uint8_t> &data);

    /// @return std::nullopt when nothing arrived within timeout.
    std::optional<Datagram> receive(Millis timeout, size_t maxSize = 65536);

    void close();
    bool isOpen() const { return fd_ >= 0; }
    uint16_t port() const { return port_; }

private:
    int fd_ = -1;
    uint16_t port_ = 0;
};

} // namespace network
} // namespace veilchat

#endif // VEILCHAT_NETWORK_SOCKET_HPP
