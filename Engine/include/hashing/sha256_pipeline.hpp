/**
 * @file sha256_pipeline.hpp
 * @brief SHA-256 hashing for build identities and artifact digests
 */

#pragma once

#include <export.hpp>
#include <vector>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <filesystem>

namespace Prebuilt {

/**
 * @brief SHA-256 over OpenSSL EVP
 *
 * Build identities must hash to the same digest in every consumer of a
 * release, so the algorithm is fixed: SHA-256, full 256-bit output.
 */
class PREBUILT_API SHA256Pipeline {
public:
    static constexpr size_t HASH_SIZE = 32; // 256 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    /**
     * @brief Hash single buffer
     * @param data Input data
     * @param len Length in bytes
     * @return 32-byte SHA-256 digest
     */
    static Hash hash(const void* data, size_t len);

    /**
     * @brief Hash string
     */
    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    /**
     * @brief Hash vector
     */
    static Hash hash(const std::vector<uint8_t>& data) {
        return hash(data.data(), data.size());
    }

    /**
     * @brief Stream a file through the digest without loading it whole
     * @throws ResolveError (IoError) if the file cannot be read
     */
    static Hash hash_file(const std::filesystem::path& path);

    /**
     * @brief Convert hash to lower-case hex string
     */
    static std::string to_hex(const Hash& hash);
};

} // namespace Prebuilt
