/**
 * @file signature_verifier.hpp
 * @brief Ed25519 detached signatures over release files
 */

#pragma once

#include <export.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace Prebuilt {

using PublicKey = std::array<uint8_t, 32>;
using PrivateKey = std::array<uint8_t, 64>; // 32-byte seed followed by the public key

/**
 * @brief Verifies detached signatures against one trusted public key.
 */
class PREBUILT_API SignatureVerifier {
public:
    static constexpr size_t PUBLIC_KEY_SIZE = 32;
    static constexpr size_t SIGNATURE_SIZE = 64;

    explicit SignatureVerifier(const PublicKey& public_key) : public_key_(public_key) {}

    /**
     * @brief True only for a well-formed signature made by the trusted key.
     *
     * A signature of the wrong length is reported as invalid, not as an error.
     */
    bool verify(const std::vector<uint8_t>& message, const std::vector<uint8_t>& signature) const;

    /**
     * @brief Parse a hex public key; nullopt unless it decodes to 32 bytes.
     */
    static std::optional<PublicKey> parse_public_key_hex(std::string_view hex);


private:
    PublicKey public_key_;
};

struct KeyPair {
    PublicKey public_key;
    PrivateKey private_key;
};

/**
 * @brief Release-side counterpart used by the signing tools and tests.
 */
class PREBUILT_API Ed25519Signer {
public:
    static constexpr size_t PRIVATE_KEY_SIZE = 64;

    static KeyPair generate();

    /**
     * @brief Deterministic key pair from a 32-byte seed (RFC 8032 secret key).
     */
    static KeyPair from_seed(const std::array<uint8_t, 32>& seed);

    static std::vector<uint8_t> sign(const PrivateKey& private_key, const std::vector<uint8_t>& message);

    /**
     * @brief Parse a 64-byte hex private key (seed + public key).
     *
     * The embedded public half must match the seed, otherwise nullopt.
     */
    static std::optional<PrivateKey> parse_private_key_hex(std::string_view hex);
};

} // namespace Prebuilt
