#include <crypto/signature_verifier.hpp>
#include <utils/hex.hpp>
#include <openssl/evp.h>
#include <algorithm>
#include <memory>
#include <stdexcept>

namespace Prebuilt {

namespace {

struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

struct EvpPkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

// EVP one-shot calls want a non-null pointer even for empty input.
const unsigned char* message_ptr(const std::vector<uint8_t>& message) {
    static const unsigned char empty = 0;
    return message.empty() ? &empty : message.data();
}

PublicKey raw_public_key(EVP_PKEY* key) {
    PublicKey public_key{};
    size_t len = public_key.size();
    if (EVP_PKEY_get_raw_public_key(key, public_key.data(), &len) != 1 || len != public_key.size()) {
        throw std::runtime_error("EVP_PKEY_get_raw_public_key failed");
    }
    return public_key;
}

KeyPair key_pair_from(EVP_PKEY* key) {
    std::array<uint8_t, 32> seed{};
    size_t seed_len = seed.size();
    if (EVP_PKEY_get_raw_private_key(key, seed.data(), &seed_len) != 1 || seed_len != seed.size()) {
        throw std::runtime_error("EVP_PKEY_get_raw_private_key failed");
    }

    KeyPair pair;
    pair.public_key = raw_public_key(key);
    std::copy(seed.begin(), seed.end(), pair.private_key.begin());
    std::copy(pair.public_key.begin(), pair.public_key.end(), pair.private_key.begin() + 32);
    return pair;
}

} // namespace

bool SignatureVerifier::verify(const std::vector<uint8_t>& message, const std::vector<uint8_t>& signature) const {
    if (signature.size() != SIGNATURE_SIZE) return false;

    EvpPkeyPtr key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                               public_key_.data(), public_key_.size()));
    if (!key) return false;

    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        return false;
    }
    return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                            message_ptr(message), message.size()) == 1;
}

std::optional<PublicKey> SignatureVerifier::parse_public_key_hex(std::string_view hex) {
    auto bytes = decode_hex(hex);
    if (!bytes || bytes->size() != PUBLIC_KEY_SIZE) return std::nullopt;
    PublicKey key{};
    std::copy(bytes->begin(), bytes->end(), key.begin());
    return key;
}

KeyPair Ed25519Signer::generate() {
    std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter> ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
        throw std::runtime_error("Ed25519 keygen init failed");
    }
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
        throw std::runtime_error("Ed25519 keygen failed");
    }
    EvpPkeyPtr key(raw);
    return key_pair_from(key.get());
}

KeyPair Ed25519Signer::from_seed(const std::array<uint8_t, 32>& seed) {
    EvpPkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()));
    if (!key) throw std::runtime_error("invalid Ed25519 seed");
    return key_pair_from(key.get());
}

std::vector<uint8_t> Ed25519Signer::sign(const PrivateKey& private_key, const std::vector<uint8_t>& message) {
    EvpPkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, private_key.data(), 32));
    if (!key) throw std::runtime_error("invalid Ed25519 private key");

    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        throw std::runtime_error("EVP_DigestSignInit failed");
    }

    std::vector<uint8_t> signature(SignatureVerifier::SIGNATURE_SIZE);
    size_t sig_len = signature.size();
    if (EVP_DigestSign(ctx.get(), signature.data(), &sig_len, message_ptr(message), message.size()) != 1) {
        throw std::runtime_error("EVP_DigestSign failed");
    }
    signature.resize(sig_len);
    return signature;
}

std::optional<PrivateKey> Ed25519Signer::parse_private_key_hex(std::string_view hex) {
    auto bytes = decode_hex(hex);
    if (!bytes || bytes->size() != PRIVATE_KEY_SIZE) return std::nullopt;

    std::array<uint8_t, 32> seed{};
    std::copy(bytes->begin(), bytes->begin() + 32, seed.begin());
    KeyPair derived = from_seed(seed);
    if (!std::equal(derived.public_key.begin(), derived.public_key.end(), bytes->begin() + 32)) {
        return std::nullopt;
    }
    return derived.private_key;
}

} // namespace Prebuilt
