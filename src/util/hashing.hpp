#ifndef VEILCHAT_UTIL_HASHING_HPP
#define VEILCHAT_UTIL_HASHING_HPP

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

/**
 * @file hashing.hpp
 * @brief OpenSSL-backed digest, randomness and encoding helpers.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL libcrypto.
 *
 * Covers what the wire layer needs: SHA-256 fingerprints, random bytes for
 * fake TLS randoms and HTTP/2 stream ids, v4 UUIDs for message ids, and
 * base64 for byte fields carried inside JSON documents.
 */

namespace veilchat {
namespace util {
namespace hashing {

inline std::string toHex(const uint8_t *data, size_t len)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(data[i]);
    }
    return oss.str();
}

/**
 * @brief Compute a SHA-256 hash of the input, return as lowercase hex.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string sha256(const std::vector<uint8_t> &input)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    if (!SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), hash)) {
        throw std::runtime_error("hashing::sha256: SHA256 computation failed.");
    }
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

inline std::string sha256(const std::string &input)
{
    return sha256(std::vector<uint8_t>(input.begin(), input.end()));
}

/**
 * @brief Cryptographically random bytes from RAND_bytes.
 * @throw std::runtime_error if the OpenSSL RNG is not seeded.
 */
inline std::vector<uint8_t> randomBytes(size_t count)
{
    std::vector<uint8_t> out(count);
    if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
        throw std::runtime_error("hashing::randomBytes: RAND_bytes failed.");
    }
    return out;
}

inline uint32_t randomUInt32()
{
    auto bytes = randomBytes(4);
    return (static_cast<uint32_t>(bytes[0]) << 24) | (static_cast<uint32_t>(bytes[1]) << 16) |
           (static_cast<uint32_t>(bytes[2]) << 8) | static_cast<uint32_t>(bytes[3]);
}

/**
 * @brief RFC 4122 version 4 UUID in canonical 8-4-4-4-12 form.
 */
inline std::string uuidV4()
{
    auto b = randomBytes(16);
    b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);
    b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);
    std::string hex = toHex(b.data(), b.size());
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

inline std::string base64Encode(const std::vector<uint8_t> &data)
{
    if (data.empty()) {
        return std::string();
    }
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data.data(), static_cast<int>(data.size()));
    if (written < 0) {
        throw std::runtime_error("hashing::base64Encode: EVP_EncodeBlock failed.");
    }
    out.resize(static_cast<size_t>(written));
    return out;
}

/**
 * @brief Decode standard padded base64.
 * @throw std::runtime_error on malformed input.
 */
inline std::vector<uint8_t> base64Decode(const std::string &encoded)
{
    if (encoded.empty()) {
        return {};
    }
    if (encoded.size() % 4 != 0) {
        throw std::runtime_error("hashing::base64Decode: length is not a multiple of 4.");
    }
    std::vector<uint8_t> out(3 * (encoded.size() / 4));
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (written < 0) {
        throw std::runtime_error("hashing::base64Decode: invalid base64 input.");
    }
    // EVP_DecodeBlock keeps the bytes produced by '=' padding; strip them.
    size_t padding = 0;
    if (encoded[encoded.size() - 1] == '=') {
        ++padding;
        if (encoded[encoded.size() - 2] == '=') {
            ++padding;
        }
    }
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

} // namespace hashing
} // namespace util
} // namespace veilchat

#endif // VEILCHAT_UTIL_HASHING_HPP
