#ifndef VEILCHAT_CRYPTO_IDENTITY_PROVIDER_HPP
#define VEILCHAT_CRYPTO_IDENTITY_PROVIDER_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Forward declaration keeps OpenSSL headers out of every includer.
typedef struct evp_pkey_st EVP_PKEY;

namespace veilchat {
namespace crypto {

/**
 * @class IdentityProvider
 * @brief Signing identity of the local node. The delivery manager only calls
 *        these three capabilities; key storage is the provider's business.
 */
class IdentityProvider
{
public:
    virtual ~IdentityProvider() = default;

    virtual std::vector<uint8_t> sign(const std::vector<uint8_t> &data) = 0;

    /// Verify sig over data against a peer's public key.
    virtual bool verify(const std::vector<uint8_t> &data, const std::vector<uint8_t> &sig,
                        const std::vector<uint8_t> &publicKey) const = 0;

    virtual std::vector<uint8_t> publicKey() const = 0;
};

/**
 * @class Ed25519Identity
 * @brief IdentityProvider backed by an in-memory OpenSSL Ed25519 key.
 */
class Ed25519Identity : public IdentityProvider
{
public:
    /// @throw std::runtime_error if OpenSSL cannot generate a key.
    static std::unique_ptr<Ed25519Identity> generate();

    ~Ed25519Identity() override;
    Ed25519Identity(const Ed25519Identity &) = delete;
    Ed25519Identity &operator=(const Ed25519Identity &) = delete;

    std::vector<uint8_t> sign(const std::vector<uint8_t> &data) override;
    bool verify(const std::vector<uint8_t> &data, const std::vector<uint8_t> &sig,
                const std::vector<uint8_t> &publicKey) const override;
    std::vector<uint8_t> publicKey() const override { return publicKey_; }

    /// First 16 bytes of SHA-256(public key), hex encoded.
    std::string peerId() const;

private:
    explicit Ed25519Identity(EVP_PKEY *key);

    EVP_PKEY *key_;
    std::vector<uint8_t> publicKey_;
};

} // namespace crypto
} // namespace veilchat

#endif // VEILCHAT_CRYPTO_IDENTITY_PROVIDER_HPP
