#pragma once

#include <export.hpp>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace Prebuilt {

/**
 * @brief Whole-file reads and crash-safe writes for the on-disk cache.
 *
 * All failures surface as ResolveError with ErrorKind::IoError.
 */
class PREBUILT_API FileIO {
public:
    static std::vector<uint8_t> read_bytes(const std::filesystem::path& path);

    /**
     * @brief Raw file contents as a byte string (no newline translation).
     */
    static std::string read_text(const std::filesystem::path& path);

    /**
     * @brief Write via a unique temp file in the same directory, then rename.
     *
     * Readers observe either the previous file, no file, or the complete new
     * contents. Parent directories are created as needed.
     */
    static void write_atomic(const std::filesystem::path& path, const uint8_t* data, size_t len);

    static void write_atomic(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
        write_atomic(path, data.data(), data.size());
    }

    /**
     * @brief Remove a regular file; missing files are not an error.
     * @return true if a file was removed
     */
    static bool remove_if_exists(const std::filesystem::path& path);

    static bool is_regular_file(const std::filesystem::path& path);
};

} // namespace Prebuilt
