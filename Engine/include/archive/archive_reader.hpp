/**
 * @file archive_reader.hpp
 * @brief In-memory readers for release archives (.zip, .tar.gz)
 */

#pragma once

#include <export.hpp>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace Prebuilt {

struct PREBUILT_API ArchiveEntry {
    std::string path;        ///< '/'-separated, as stored in the archive
    bool regular_file = false;
    uint64_t size = 0;
};

/**
 * @brief Random-access view of an archive's entries.
 */
class PREBUILT_API ArchiveReader {
public:
    virtual ~ArchiveReader() = default;

    virtual const std::vector<ArchiveEntry>& entries() const = 0;

    /**
     * @brief Contents of a regular-file entry.
     * @throws ResolveError ArchiveInvalid on corrupt data
     */
    virtual std::vector<uint8_t> read(size_t index) const = 0;

    /**
     * @brief Reader chosen by filename suffix (.zip, .tar.gz, .tgz).
     * @throws ResolveError UnsupportedArchive for any other suffix,
     *         ArchiveInvalid if the index cannot be parsed
     */
    static std::unique_ptr<ArchiveReader> open(const std::filesystem::path& archive);

    static bool is_supported(const std::filesystem::path& archive);
};

/**
 * @brief ZIP reader: central directory, stored and deflate entries, CRC-32
 *        checked. Zip64 and encrypted entries are rejected.
 */
class PREBUILT_API ZipReader : public ArchiveReader {
public:
    explicit ZipReader(std::vector<uint8_t> bytes);

    const std::vector<ArchiveEntry>& entries() const override { return entries_; }
    std::vector<uint8_t> read(size_t index) const override;

private:
    struct Record {
        uint16_t method;
        uint16_t flags;
        uint32_t crc;
        uint32_t compressed_size;
        uint32_t local_offset;
    };

    std::vector<uint8_t> bytes_;
    std::vector<ArchiveEntry> entries_;
    std::vector<Record> records_;
};

/**
 * @brief gzip-compressed TAR reader: ustar prefix + name, GNU long names,
 *        pax path records. Header checksums are verified.
 */
class PREBUILT_API TarGzReader : public ArchiveReader {
public:
    static constexpr size_t BLOCK_SIZE = 512;

    explicit TarGzReader(const std::vector<uint8_t>& compressed);

    const std::vector<ArchiveEntry>& entries() const override { return entries_; }
    std::vector<uint8_t> read(size_t index) const override;

private:
    std::vector<uint8_t> tar_;
    std::vector<ArchiveEntry> entries_;
    std::vector<size_t> offsets_;
};

} // namespace Prebuilt
