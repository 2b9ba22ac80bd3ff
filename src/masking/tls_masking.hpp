#ifndef VEILCHAT_MASKING_TLS_MASKING_HPP
#define VEILCHAT_MASKING_TLS_MASKING_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "network/errors.hpp"
#include "network/socket.hpp"

/**
 * @file tls_masking.hpp
 * @brief Makes a VeilChat byte stream look like TLS 1.2/1.3 carrying HTTP/2.
 *
 * Nothing here is cryptographic. The handshake exchanges records that are
 * shaped like a Client Hello / Server Hello / Finished so that SNI and
 * record-type inspection sees ordinary web traffic, then every message is
 * carried as HTTP/2 DATA frames inside TLS Application Data records.
 *
 * The record and frame helpers are pure functions over byte vectors;
 * MaskedConnection drives them over a TcpSocket.
 */

namespace veilchat {
namespace masking {

constexpr uint8_t TLS_CHANGE_CIPHER_SPEC = 0x14;
constexpr uint8_t TLS_ALERT = 0x15;
constexpr uint8_t TLS_HANDSHAKE = 0x16;
constexpr uint8_t TLS_APPLICATION_DATA = 0x17;
constexpr uint8_t TLS_HEARTBEAT = 0x18;

constexpr uint8_t HANDSHAKE_CLIENT_HELLO = 0x01;
constexpr uint8_t HANDSHAKE_SERVER_HELLO = 0x02;
constexpr uint8_t HANDSHAKE_FINISHED = 0x14;

constexpr size_t TLS_RECORD_HEADER_SIZE = 5;
/// Largest plaintext fragment a real TLS record carries.
constexpr size_t TLS_MAX_FRAGMENT = 16384;

constexpr uint8_t HTTP2_FRAME_DATA = 0x00;
constexpr uint8_t HTTP2_FLAG_END_STREAM = 0x01;
constexpr size_t HTTP2_FRAME_HEADER_SIZE = 9;
/// DATA payload per record so that frame header + payload fits one fragment.
constexpr size_t HTTP2_MAX_DATA_PER_RECORD = TLS_MAX_FRAGMENT - HTTP2_FRAME_HEADER_SIZE;

/// Upper bound on a reassembled message.
constexpr size_t MAX_MASKED_MESSAGE_SIZE = 1024 * 1024;

enum class MaskingFailure
{
    HandshakeFailed,
    CertificateError,
    ConnectionError
};

const char *failureName(MaskingFailure failure);

class MaskingError : public network::MessengerError
{
public:
    MaskingError(MaskingFailure failure, const std::string &what)
        : network::MessengerError(network::ErrorKind::MaskingError,
                                  std::string("masking ") + failureName(failure) + ": " + what)
        , failure_(failure)
    {
    }

    MaskingFailure failure() const noexcept { return failure_; }

private:
    MaskingFailure failure_;
};

struct Http2Frame
{
    uint8_t type = HTTP2_FRAME_DATA;
    uint8_t flags = 0;
    uint32_t streamId = 0;
    std::vector<uint8_t> payload;
};

/**
 * @brief Structural plausibility of a TLS record at the start of bytes:
 *        at least 5 bytes, content type 0x14..0x18, version
 *        0x0301/0x0302/0x0303 and a declared length that fits in the
 *        remaining bytes.
 */
bool validateTlsFrame(const std::vector<uint8_t> &bytes);

/// A single Handshake record holding a Client Hello.
bool validateClientHello(const std::vector<uint8_t> &record);

/// A single Handshake record holding a Server Hello.
bool validateServerHello(const std::vector<uint8_t> &record);

/// SNI host name carried by a Client Hello record, if present.
std::optional<std::string> extractServerName(const std::vector<uint8_t> &record);

/// Client Hello with fresh random, SNI = serverName and ALPN h2, http/1.1.
std::vector<uint8_t> buildClientHello(const std::string &serverName);
std::vector<uint8_t> buildServerHello();
std::vector<uint8_t> buildClientFinished();

/**
 * @throw MaskingError ConnectionError if payload exceeds a 16-bit length.
 */
std::vector<uint8_t> wrapTlsRecord(uint8_t contentType, const std::vector<uint8_t> &payload);

std::vector<uint8_t> wrapHttp2Frame(const Http2Frame &frame);
std::vector<uint8_t> wrapHttp2Data(const std::vector<uint8_t> &payload, uint32_t streamId,
                                   bool endStream);

/**
 * @brief Parse one complete frame.
 * @throw MaskingError ConnectionError if bytes is not exactly one frame.
 */
Http2Frame unwrapHttp2Frame(const std::vector<uint8_t> &bytes);

/**
 * @brief Message -> sequence of Application Data records, each holding one
 *        DATA frame on streamId. The last frame carries END_STREAM.
 */
std::vector<uint8_t> wrapApplicationData(const std::vector<uint8_t> &message,
                                         uint32_t streamId = 1);

/**
 * @brief Inverse of wrapApplicationData() over a fully buffered byte string.
 * @throw MaskingError ConnectionError for a non Application Data record, a
 *        non-DATA frame, trailing or truncated bytes, or a missing END_STREAM.
 */
std::vector<uint8_t> unwrapApplicationData(const std::vector<uint8_t> &records);

struct MaskingTimeouts
{
    std::chrono::milliseconds connect{10000};
    std::chrono::milliseconds write{5000};
    std::chrono::milliseconds handshake{10000};
};

/**
 * @class MaskedConnection
 * @brief A TcpSocket that completed the fake handshake and exchanges
 *        messages as masked application data.
 *
 * Errors are never retried here. Socket level failures surface as the
 * network::MessengerError raised by TcpSocket, framing problems as
 * MaskingError.
 */
class MaskedConnection
{
public:
    /**
     * @brief Connect and run the client side of the handshake:
     *        Client Hello -> (Server Hello) -> Finished.
     * @throw MaskingError HandshakeFailed for a malformed Server Hello,
     *        CertificateError if the server answers with an alert.
     */
    static MaskedConnection connectAsClient(const std::string &host, uint16_t port,
                                            const std::string &maskDomain,
                                            const MaskingTimeouts &timeouts);

    /**
     * @brief Run the server side on an accepted socket:
     *        (Client Hello) -> Server Hello -> (Finished).
     * @throw MaskingError HandshakeFailed for a malformed Client Hello or
     *        final client record.
     */
    static MaskedConnection acceptAsServer(network::TcpSocket socket,
                                           const MaskingTimeouts &timeouts);

    MaskedConnection(MaskedConnection &&) = default;
    MaskedConnection &operator=(MaskedConnection &&) = default;

    void send(const std::vector<uint8_t> &message);

    /// Read records until a DATA frame with END_STREAM completes a message.
    std::vector<uint8_t> receive(std::chrono::milliseconds timeout);

    /// Server name the client asked for (server side only).
    const std::string &serverName() const { return serverName_; }
    const std::string &peerAddress() const { return socket_.peerAddress(); }
    network::TcpSocket &socket() { return socket_; }

private:
    MaskedConnection(network::TcpSocket socket, const MaskingTimeouts &timeouts, bool isClient);

    std::vector<uint8_t> readRecord(std::chrono::milliseconds timeout, MaskingFailure onGarbage);

    network::TcpSocket socket_;
    MaskingTimeouts timeouts_;
    // Client-initiated HTTP/2 streams are odd, server-initiated ones even.
    uint32_t nextStreamId_;
    std::string serverName_;
};

} // namespace masking
} // namespace veilchat

#endif // VEILCHAT_MASKING_TLS_MASKING_HPP
