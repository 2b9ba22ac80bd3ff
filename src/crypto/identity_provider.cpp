#include "crypto/identity_provider.hpp"
#include "util/hashing.hpp"

#include <openssl/evp.h>
#include <stdexcept>

namespace veilchat {
namespace crypto {

namespace {

struct PkeyCtxDeleter
{
    void operator()(EVP_PKEY_CTX *ctx) const { EVP_PKEY_CTX_free(ctx); }
};

struct MdCtxDeleter
{
    void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

struct PkeyDeleter
{
    void operator()(EVP_PKEY *key) const { EVP_PKEY_free(key); }
};

constexpr size_t ED25519_KEY_SIZE = 32;
constexpr size_t ED25519_SIG_SIZE = 64;

} // namespace

std::unique_ptr<Ed25519Identity> Ed25519Identity::generate()
{
    std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter> ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
        throw std::runtime_error("Ed25519Identity: keygen init failed");
    }
    EVP_PKEY *key = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &key) != 1 || key == nullptr) {
        throw std::runtime_error("Ed25519Identity: keygen failed");
    }
    return std::unique_ptr<Ed25519Identity>(new Ed25519Identity(key));
}

Ed25519Identity::Ed25519Identity(EVP_PKEY *key)
    : key_(key)
    , publicKey_(ED25519_KEY_SIZE)
{
    size_t len = publicKey_.size();
    if (EVP_PKEY_get_raw_public_key(key_, publicKey_.data(), &len) != 1) {
        EVP_PKEY_free(key_);
        throw std::runtime_error("Ed25519Identity: cannot export public key");
    }
    publicKey_.resize(len);
}

Ed25519Identity::~Ed25519Identity()
{
    EVP_PKEY_free(key_);
}

std::vector<uint8_t> Ed25519Identity::sign(const std::vector<uint8_t> &data)
{
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> md(EVP_MD_CTX_new());
    if (!md || EVP_DigestSignInit(md.get(), nullptr, nullptr, nullptr, key_) != 1) {
        throw std::runtime_error("Ed25519Identity: sign init failed");
    }
    std::vector<uint8_t> sig(ED25519_SIG_SIZE);
    size_t sigLen = sig.size();
    if (EVP_DigestSign(md.get(), sig.data(), &sigLen, data.data(), data.size()) != 1) {
        throw std::runtime_error("Ed25519Identity: sign failed");
    }
    sig.resize(sigLen);
    return sig;
}

bool Ed25519Identity::verify(const std::vector<uint8_t> &data, const std::vector<uint8_t> &sig,
                             const std::vector<uint8_t> &publicKey) const
{
    if (publicKey.size() != ED25519_KEY_SIZE || sig.size() != ED25519_SIG_SIZE) {
        return false;
    }
    std::unique_ptr<EVP_PKEY, PkeyDeleter> peerKey(
        EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, publicKey.data(), publicKey.size()));
    if (!peerKey) {
        return false;
    }
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> md(EVP_MD_CTX_new());
    if (!md || EVP_DigestVerifyInit(md.get(), nullptr, nullptr, nullptr, peerKey.get()) != 1) {
        return false;
    }
    return EVP_DigestVerify(md.get(), sig.data(), sig.size(), data.data(), data.size()) == 1;
}

std::string Ed25519Identity::peerId() const
{
    return util::hashing::sha256(publicKey_).substr(0, 32);
}

} // namespace crypto
} // namespace veilchat
