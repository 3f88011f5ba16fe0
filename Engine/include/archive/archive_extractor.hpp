#pragma once

#include <archive/archive_reader.hpp>
#include <utils/logger.hpp>
#include <export.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Prebuilt {

/**
 * @brief Pulls the dynamic library out of a verified release archive.
 *
 * Bound to one extraction directory (per build id and target triple). A
 * library already present there is returned as-is, so repeated resolutions
 * decode the archive once.
 */
class PREBUILT_API ArchiveExtractor {
public:
    ArchiveExtractor(std::filesystem::path extraction_dir, Reporter& reporter)
        : extraction_dir_(std::move(extraction_dir)), reporter_(reporter) {}

    /**
     * @param expected_extension including the dot, e.g. ".so"
     * @throws ResolveError UnsupportedArchive, ArchiveInvalid,
     *         LibraryNotFoundInArchive, IoError
     */
    std::filesystem::path extract_library(const std::filesystem::path& archive, const std::string& expected_extension);

    /**
     * @brief Index of the entry to extract: extension match under a "lib"
     *        directory first, then the first extension match.
     */
    static std::optional<size_t> select_entry(const std::vector<ArchiveEntry>& entries,
                                              const std::string& expected_extension);

    const std::filesystem::path& extraction_dir() const { return extraction_dir_; }

private:
    std::optional<std::filesystem::path> find_existing(const std::string& expected_extension) const;

    std::filesystem::path extraction_dir_;
    Reporter& reporter_;
};

} // namespace Prebuilt
