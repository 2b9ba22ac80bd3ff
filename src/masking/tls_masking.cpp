#include "masking/tls_masking.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

#include <algorithm>

namespace veilchat {
namespace masking {

namespace {

// Cipher suites offered by a current browser; only the shape matters.
const uint16_t kClientCipherSuites[] = {
    0x1301, 0x1302, 0x1303, 0xc02b, 0xc02f, 0xc02c, 0xc030, 0xcca9, 0xcca8, 0xc013, 0xc014,
};

constexpr uint16_t EXT_SERVER_NAME = 0x0000;
constexpr uint16_t EXT_SUPPORTED_GROUPS = 0x000a;
constexpr uint16_t EXT_EC_POINT_FORMATS = 0x000b;
constexpr uint16_t EXT_ALPN = 0x0010;
constexpr uint16_t EXT_SUPPORTED_VERSIONS = 0x002b;

void putU8(std::vector<uint8_t> &out, uint8_t v)
{
    out.push_back(v);
}

void putU16(std::vector<uint8_t> &out, uint16_t v)
{
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

void putU24(std::vector<uint8_t> &out, uint32_t v)
{
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

void putBytes(std::vector<uint8_t> &out, const std::vector<uint8_t> &bytes)
{
    out.insert(out.end(), bytes.begin(), bytes.end());
}

void putExtension(std::vector<uint8_t> &out, uint16_t type, const std::vector<uint8_t> &data)
{
    putU16(out, type);
    putU16(out, static_cast<uint16_t>(data.size()));
    putBytes(out, data);
}

std::vector<uint8_t> handshakeMessage(uint8_t type, const std::vector<uint8_t> &body)
{
    std::vector<uint8_t> msg;
    msg.reserve(4 + body.size());
    putU8(msg, type);
    putU24(msg, static_cast<uint32_t>(body.size()));
    putBytes(msg, body);
    return msg;
}

/// Bounds-checked big-endian reader; every getter returns false past the end.
class ByteReader
{
public:
    ByteReader(const std::vector<uint8_t> &bytes, size_t pos)
        : bytes_(bytes)
        , pos_(pos)
    {
    }

    bool u8(uint8_t &v)
    {
        if (remaining() < 1) {
            return false;
        }
        v = bytes_[pos_++];
        return true;
    }

    bool u16(uint16_t &v)
    {
        if (remaining() < 2) {
            return false;
        }
        v = static_cast<uint16_t>((bytes_[pos_] << 8) | bytes_[pos_ + 1]);
        pos_ += 2;
        return true;
    }

    bool u24(uint32_t &v)
    {
        if (remaining() < 3) {
            return false;
        }
        v = (static_cast<uint32_t>(bytes_[pos_]) << 16) |
            (static_cast<uint32_t>(bytes_[pos_ + 1]) << 8) | bytes_[pos_ + 2];
        pos_ += 3;
        return true;
    }

    bool skip(size_t n)
    {
        if (remaining() < n) {
            return false;
        }
        pos_ += n;
        return true;
    }

    bool string(size_t n, std::string &out)
    {
        if (remaining() < n) {
            return false;
        }
        out.assign(bytes_.begin() + static_cast<std::ptrdiff_t>(pos_),
                   bytes_.begin() + static_cast<std::ptrdiff_t>(pos_ + n));
        pos_ += n;
        return true;
    }

    size_t remaining() const { return bytes_.size() - pos_; }
    size_t position() const { return pos_; }

private:
    const std::vector<uint8_t> &bytes_;
    size_t pos_;
};

bool plausibleHeader(uint8_t contentType, uint16_t version)
{
    return contentType >= TLS_CHANGE_CIPHER_SPEC && contentType <= TLS_HEARTBEAT &&
           (version == 0x0301 || version == 0x0302 || version == 0x0303);
}

/// Exactly one record, nothing trailing.
bool isSingleRecord(const std::vector<uint8_t> &record)
{
    if (!validateTlsFrame(record)) {
        return false;
    }
    size_t declared = (static_cast<size_t>(record[3]) << 8) | record[4];
    return declared == record.size() - TLS_RECORD_HEADER_SIZE;
}

bool parseServerNameExtension(ByteReader r, std::string *serverName)
{
    uint16_t listLen = 0;
    if (!r.u16(listLen) || listLen != r.remaining()) {
        return false;
    }
    while (r.remaining() > 0) {
        uint8_t nameType = 0;
        uint16_t nameLen = 0;
        std::string name;
        if (!r.u8(nameType) || !r.u16(nameLen) || !r.string(nameLen, name)) {
            return false;
        }
        if (nameType == 0 && serverName != nullptr && serverName->empty()) {
            *serverName = name;
        }
    }
    return true;
}

/**
 * Walk a Client/Server Hello record. serverName, when given, receives the
 * SNI host name of a Client Hello.
 */
bool parseHello(const std::vector<uint8_t> &record, uint8_t expectedType, std::string *serverName)
{
    if (!isSingleRecord(record) || record[0] != TLS_HANDSHAKE) {
        return false;
    }

    ByteReader r(record, TLS_RECORD_HEADER_SIZE);
    uint8_t type = 0;
    uint32_t bodyLen = 0;
    if (!r.u8(type) || type != expectedType || !r.u24(bodyLen) || bodyLen != r.remaining()) {
        return false;
    }

    uint16_t version = 0;
    if (!r.u16(version) || (version >> 8) != 0x03 || !r.skip(32)) {
        return false;
    }

    uint8_t sessionIdLen = 0;
    if (!r.u8(sessionIdLen) || sessionIdLen > 32 || !r.skip(sessionIdLen)) {
        return false;
    }

    if (expectedType == HANDSHAKE_CLIENT_HELLO) {
        uint16_t suitesLen = 0;
        uint8_t compressionLen = 0;
        if (!r.u16(suitesLen) || suitesLen == 0 || (suitesLen % 2) != 0 || !r.skip(suitesLen)) {
            return false;
        }
        if (!r.u8(compressionLen) || compressionLen == 0 || !r.skip(compressionLen)) {
            return false;
        }
    } else {
        uint16_t suite = 0;
        uint8_t compression = 0;
        if (!r.u16(suite) || !r.u8(compression)) {
            return false;
        }
    }

    if (r.remaining() == 0) {
        return true;
    }

    uint16_t extensionsLen = 0;
    if (!r.u16(extensionsLen) || extensionsLen != r.remaining()) {
        return false;
    }
    while (r.remaining() > 0) {
        uint16_t extType = 0;
        uint16_t extLen = 0;
        if (!r.u16(extType) || !r.u16(extLen) || r.remaining() < extLen) {
            return false;
        }
        if (extType == EXT_SERVER_NAME && expectedType == HANDSHAKE_CLIENT_HELLO) {
            std::vector<uint8_t> extData(record.begin() + static_cast<std::ptrdiff_t>(r.position()),
                                         record.begin() +
                                             static_cast<std::ptrdiff_t>(r.position() + extLen));
            if (!parseServerNameExtension(ByteReader(extData, 0), serverName)) {
                return false;
            }
        }
        r.skip(extLen);
    }
    return true;
}

std::vector<uint8_t> slice(const std::vector<uint8_t> &bytes, size_t from, size_t len)
{
    return std::vector<uint8_t>(bytes.begin() + static_cast<std::ptrdiff_t>(from),
                                bytes.begin() + static_cast<std::ptrdiff_t>(from + len));
}

} // namespace

const char *failureName(MaskingFailure failure)
{
    switch (failure) {
    case MaskingFailure::HandshakeFailed:
        return "HandshakeFailed";
    case MaskingFailure::CertificateError:
        return "CertificateError";
    case MaskingFailure::ConnectionError:
        return "ConnectionError";
    }
    return "Unknown";
}

bool validateTlsFrame(const std::vector<uint8_t> &bytes)
{
    if (bytes.size() < TLS_RECORD_HEADER_SIZE) {
        return false;
    }
    uint16_t version = static_cast<uint16_t>((bytes[1] << 8) | bytes[2]);
    if (!plausibleHeader(bytes[0], version)) {
        return false;
    }
    size_t declared = (static_cast<size_t>(bytes[3]) << 8) | bytes[4];
    return declared <= bytes.size() - TLS_RECORD_HEADER_SIZE;
}

bool validateClientHello(const std::vector<uint8_t> &record)
{
    return parseHello(record, HANDSHAKE_CLIENT_HELLO, nullptr);
}

bool validateServerHello(const std::vector<uint8_t> &record)
{
    return parseHello(record, HANDSHAKE_SERVER_HELLO, nullptr);
}

std::optional<std::string> extractServerName(const std::vector<uint8_t> &record)
{
    std::string name;
    if (!parseHello(record, HANDSHAKE_CLIENT_HELLO, &name) || name.empty()) {
        return std::nullopt;
    }
    return name;
}

std::vector<uint8_t> buildClientHello(const std::string &serverName)
{
    if (serverName.size() > 253) {
        throw MaskingError(MaskingFailure::HandshakeFailed, "server name too long: " + serverName);
    }

    std::vector<uint8_t> body;
    putU16(body, 0x0303);
    putBytes(body, util::hashing::randomBytes(32));
    putU8(body, 32);
    putBytes(body, util::hashing::randomBytes(32));

    putU16(body, static_cast<uint16_t>(sizeof(kClientCipherSuites)));
    for (uint16_t suite : kClientCipherSuites) {
        putU16(body, suite);
    }
    putU8(body, 1);
    putU8(body, 0x00);

    std::vector<uint8_t> extensions;
    if (!serverName.empty()) {
        std::vector<uint8_t> sni;
        putU16(sni, static_cast<uint16_t>(3 + serverName.size()));
        putU8(sni, 0x00);
        putU16(sni, static_cast<uint16_t>(serverName.size()));
        sni.insert(sni.end(), serverName.begin(), serverName.end());
        putExtension(extensions, EXT_SERVER_NAME, sni);
    }

    putExtension(extensions, EXT_EC_POINT_FORMATS, {0x01, 0x00});
    putExtension(extensions, EXT_SUPPORTED_GROUPS, {0x00, 0x04, 0x00, 0x1d, 0x00, 0x17});

    std::vector<uint8_t> alpn;
    putU16(alpn, 12);
    putU8(alpn, 2);
    alpn.push_back('h');
    alpn.push_back('2');
    putU8(alpn, 8);
    const std::string http11 = "http/1.1";
    alpn.insert(alpn.end(), http11.begin(), http11.end());
    putExtension(extensions, EXT_ALPN, alpn);

    putExtension(extensions, EXT_SUPPORTED_VERSIONS, {0x04, 0x03, 0x04, 0x03, 0x03});

    putU16(body, static_cast<uint16_t>(extensions.size()));
    putBytes(body, extensions);

    return wrapTlsRecord(TLS_HANDSHAKE, handshakeMessage(HANDSHAKE_CLIENT_HELLO, body));
}

std::vector<uint8_t> buildServerHello()
{
    std::vector<uint8_t> body;
    putU16(body, 0x0303);
    putBytes(body, util::hashing::randomBytes(32));
    putU8(body, 32);
    putBytes(body, util::hashing::randomBytes(32));
    putU16(body, 0x1301);
    putU8(body, 0x00);

    std::vector<uint8_t> extensions;
    putExtension(extensions, EXT_SUPPORTED_VERSIONS, {0x03, 0x04});
    putExtension(extensions, EXT_ALPN, {0x00, 0x03, 0x02, 'h', '2'});
    putU16(body, static_cast<uint16_t>(extensions.size()));
    putBytes(body, extensions);

    return wrapTlsRecord(TLS_HANDSHAKE, handshakeMessage(HANDSHAKE_SERVER_HELLO, body));
}

std::vector<uint8_t> buildClientFinished()
{
    return wrapTlsRecord(TLS_HANDSHAKE,
                         handshakeMessage(HANDSHAKE_FINISHED, util::hashing::randomBytes(12)));
}

std::vector<uint8_t> wrapTlsRecord(uint8_t contentType, const std::vector<uint8_t> &payload)
{
    if (payload.size() > 0xFFFF) {
        throw MaskingError(MaskingFailure::ConnectionError,
                           "record payload of " + std::to_string(payload.size()) +
                               " bytes does not fit a TLS record");
    }
    std::vector<uint8_t> record;
    record.reserve(TLS_RECORD_HEADER_SIZE + payload.size());
    putU8(record, contentType);
    putU16(record, 0x0303);
    putU16(record, static_cast<uint16_t>(payload.size()));
    putBytes(record, payload);
    return record;
}

std::vector<uint8_t> wrapHttp2Frame(const Http2Frame &frame)
{
    if (frame.payload.size() > 0xFFFFFF) {
        throw MaskingError(MaskingFailure::ConnectionError, "HTTP/2 frame payload too large");
    }
    std::vector<uint8_t> out;
    out.reserve(HTTP2_FRAME_HEADER_SIZE + frame.payload.size());
    putU24(out, static_cast<uint32_t>(frame.payload.size()));
    putU8(out, frame.type);
    putU8(out, frame.flags);
    uint32_t streamId = frame.streamId & 0x7FFFFFFFu;
    putU16(out, static_cast<uint16_t>(streamId >> 16));
    putU16(out, static_cast<uint16_t>(streamId & 0xFFFF));
    putBytes(out, frame.payload);
    return out;
}

std::vector<uint8_t> wrapHttp2Data(const std::vector<uint8_t> &payload, uint32_t streamId,
                                   bool endStream)
{
    Http2Frame frame;
    frame.type = HTTP2_FRAME_DATA;
    frame.flags = endStream ? HTTP2_FLAG_END_STREAM : 0;
    frame.streamId = streamId;
    frame.payload = payload;
    return wrapHttp2Frame(frame);
}

Http2Frame unwrapHttp2Frame(const std::vector<uint8_t> &bytes)
{
    if (bytes.size() < HTTP2_FRAME_HEADER_SIZE) {
        throw MaskingError(MaskingFailure::ConnectionError,
                           "HTTP/2 frame shorter than its 9-byte header");
    }
    size_t length = (static_cast<size_t>(bytes[0]) << 16) | (static_cast<size_t>(bytes[1]) << 8) |
                    bytes[2];
    if (HTTP2_FRAME_HEADER_SIZE + length != bytes.size()) {
        throw MaskingError(MaskingFailure::ConnectionError,
                           "HTTP/2 frame length " + std::to_string(length) + " does not match " +
                               std::to_string(bytes.size() - HTTP2_FRAME_HEADER_SIZE) +
                               " available bytes");
    }

    Http2Frame frame;
    frame.type = bytes[3];
    frame.flags = bytes[4];
    frame.streamId = ((static_cast<uint32_t>(bytes[5]) << 24) |
                      (static_cast<uint32_t>(bytes[6]) << 16) |
                      (static_cast<uint32_t>(bytes[7]) << 8) | bytes[8]) &
                     0x7FFFFFFFu;
    frame.payload = slice(bytes, HTTP2_FRAME_HEADER_SIZE, length);
    return frame;
}

std::vector<uint8_t> wrapApplicationData(const std::vector<uint8_t> &message, uint32_t streamId)
{
    std::vector<uint8_t> out;
    size_t offset = 0;
    do {
        size_t chunk = std::min(message.size() - offset, HTTP2_MAX_DATA_PER_RECORD);
        bool last = offset + chunk == message.size();
        putBytes(out, wrapTlsRecord(TLS_APPLICATION_DATA,
                                    wrapHttp2Data(slice(message, offset, chunk), streamId, last)));
        offset += chunk;
    } while (offset < message.size());
    return out;
}

std::vector<uint8_t> unwrapApplicationData(const std::vector<uint8_t> &records)
{
    std::vector<uint8_t> message;
    size_t pos = 0;
    while (pos < records.size()) {
        std::vector<uint8_t> rest = slice(records, pos, records.size() - pos);
        if (!validateTlsFrame(rest)) {
            throw MaskingError(MaskingFailure::ConnectionError,
                               "truncated or malformed TLS record at offset " + std::to_string(pos));
        }
        if (rest[0] != TLS_APPLICATION_DATA) {
            throw MaskingError(MaskingFailure::ConnectionError,
                               "unexpected TLS content type " + std::to_string(rest[0]));
        }
        size_t length = (static_cast<size_t>(rest[3]) << 8) | rest[4];
        Http2Frame frame = unwrapHttp2Frame(slice(rest, TLS_RECORD_HEADER_SIZE, length));
        if (frame.type != HTTP2_FRAME_DATA) {
            throw MaskingError(MaskingFailure::ConnectionError,
                               "unexpected HTTP/2 frame type " + std::to_string(frame.type));
        }
        putBytes(message, frame.payload);
        if (message.size() > MAX_MASKED_MESSAGE_SIZE) {
            throw MaskingError(MaskingFailure::ConnectionError, "masked message too large");
        }
        pos += TLS_RECORD_HEADER_SIZE + length;

        if ((frame.flags & HTTP2_FLAG_END_STREAM) != 0) {
            if (pos != records.size()) {
                throw MaskingError(MaskingFailure::ConnectionError,
                                   "trailing bytes after END_STREAM");
            }
            return message;
        }
    }
    throw MaskingError(MaskingFailure::ConnectionError, "stream ended without END_STREAM");
}

// ---------------------------------------------------------------------------
// MaskedConnection
// ---------------------------------------------------------------------------

MaskedConnection::MaskedConnection(network::TcpSocket socket, const MaskingTimeouts &timeouts,
                                   bool isClient)
    : socket_(std::move(socket))
    , timeouts_(timeouts)
    , nextStreamId_(isClient ? 1 : 2)
{
}

MaskedConnection MaskedConnection::connectAsClient(const std::string &host, uint16_t port,
                                                   const std::string &maskDomain,
                                                   const MaskingTimeouts &timeouts)
{
    MaskedConnection conn(network::TcpSocket::connectTo(host, port, timeouts.connect), timeouts,
                          true);

    conn.socket_.sendAll(buildClientHello(maskDomain), timeouts.write);

    std::vector<uint8_t> reply =
        conn.readRecord(timeouts.handshake, MaskingFailure::HandshakeFailed);
    if (!reply.empty() && reply[0] == TLS_ALERT) {
        throw MaskingError(MaskingFailure::CertificateError,
                           "server " + conn.peerAddress() + " answered the Client Hello with an alert");
    }
    if (!validateServerHello(reply)) {
        throw MaskingError(MaskingFailure::HandshakeFailed,
                           "malformed Server Hello from " + conn.peerAddress());
    }

    conn.socket_.sendAll(buildClientFinished(), timeouts.write);
    util::logger::debug("[MaskedConnection] handshake with " + conn.peerAddress() +
                        " complete (sni=" + maskDomain + ")");
    return conn;
}

MaskedConnection MaskedConnection::acceptAsServer(network::TcpSocket socket,
                                                  const MaskingTimeouts &timeouts)
{
    MaskedConnection conn(std::move(socket), timeouts, false);

    std::vector<uint8_t> hello =
        conn.readRecord(timeouts.handshake, MaskingFailure::HandshakeFailed);
    if (!validateClientHello(hello)) {
        throw MaskingError(MaskingFailure::HandshakeFailed,
                           "malformed Client Hello from " + conn.peerAddress());
    }
    conn.serverName_ = extractServerName(hello).value_or("");

    conn.socket_.sendAll(buildServerHello(), timeouts.write);

    std::vector<uint8_t> finished =
        conn.readRecord(timeouts.handshake, MaskingFailure::HandshakeFailed);
    if (!isSingleRecord(finished) ||
        (finished[0] != TLS_HANDSHAKE && finished[0] != TLS_CHANGE_CIPHER_SPEC)) {
        throw MaskingError(MaskingFailure::HandshakeFailed,
                           "unexpected final handshake record from " + conn.peerAddress());
    }

    util::logger::debug("[MaskedConnection] accepted handshake from " + conn.peerAddress() +
                        " (sni=" + conn.serverName_ + ")");
    return conn;
}

void MaskedConnection::send(const std::vector<uint8_t> &message)
{
    if (message.size() > MAX_MASKED_MESSAGE_SIZE) {
        throw MaskingError(MaskingFailure::ConnectionError, "masked message too large");
    }
    std::vector<uint8_t> records = wrapApplicationData(message, nextStreamId_);
    nextStreamId_ += 2;
    socket_.sendAll(records, timeouts_.write);
}

std::vector<uint8_t> MaskedConnection::receive(std::chrono::milliseconds timeout)
{
    std::vector<uint8_t> message;
    for (;;) {
        std::vector<uint8_t> record = readRecord(timeout, MaskingFailure::ConnectionError);
        if (record[0] != TLS_APPLICATION_DATA) {
            throw MaskingError(MaskingFailure::ConnectionError,
                               record[0] == TLS_ALERT
                                   ? "peer " + peerAddress() + " sent an alert"
                                   : "unexpected TLS content type " + std::to_string(record[0]));
        }
        Http2Frame frame =
            unwrapHttp2Frame(slice(record, TLS_RECORD_HEADER_SIZE,
                                   record.size() - TLS_RECORD_HEADER_SIZE));
        if (frame.type != HTTP2_FRAME_DATA) {
            throw MaskingError(MaskingFailure::ConnectionError,
                               "unexpected HTTP/2 frame type " + std::to_string(frame.type));
        }
        putBytes(message, frame.payload);
        if (message.size() > MAX_MASKED_MESSAGE_SIZE) {
            throw MaskingError(MaskingFailure::ConnectionError, "masked message too large");
        }
        if ((frame.flags & HTTP2_FLAG_END_STREAM) != 0) {
            return message;
        }
    }
}

std::vector<uint8_t> MaskedConnection::readRecord(std::chrono::milliseconds timeout,
                                                  MaskingFailure onGarbage)
{
    std::vector<uint8_t> record = socket_.readExact(TLS_RECORD_HEADER_SIZE, timeout);
    // Reject before waiting for a body whose length is not a TLS length.
    uint16_t version = static_cast<uint16_t>((record[1] << 8) | record[2]);
    if (!plausibleHeader(record[0], version)) {
        throw MaskingError(onGarbage, "peer " + peerAddress() + " did not send a TLS record");
    }
    size_t length = (static_cast<size_t>(record[3]) << 8) | record[4];
    if (length > 0) {
        std::vector<uint8_t> body = socket_.readExact(length, timeout);
        putBytes(record, body);
    }
    return record;
}

} // namespace masking
} // namespace veilchat
