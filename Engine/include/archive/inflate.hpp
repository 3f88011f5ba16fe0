#pragma once

#include <export.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Prebuilt {

/**
 * @brief zlib decompression for archive payloads.
 *
 * Corrupt or truncated input throws ResolveError ArchiveInvalid.
 */
class PREBUILT_API Inflate {
public:
    /**
     * @brief Decompress the first member of a gzip stream.
     */
    static std::vector<uint8_t> gunzip(const uint8_t* data, size_t len);

    static std::vector<uint8_t> gunzip(const std::vector<uint8_t>& data) {
        return gunzip(data.data(), data.size());
    }

    /**
     * @brief Decompress a raw deflate stream (ZIP method 8) of known size.
     */
    static std::vector<uint8_t> inflate_raw(const uint8_t* data, size_t len, size_t expected_size);
};

} // namespace Prebuilt
