#include <archive/archive_reader.hpp>
#include <archive/inflate.hpp>
#include <storage/file_io.hpp>
#include <core/errors.hpp>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <zlib.h>

namespace Prebuilt {

namespace {

[[noreturn]] void corrupt(const std::string& message) {
    throw ResolveError(ErrorKind::ArchiveInvalid, message);
}

uint16_t le16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t le32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

std::string lower_filename(const std::filesystem::path& path) {
    std::string name = path.filename().string();
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_zip(const std::string& name) { return ends_with(name, ".zip"); }
bool is_targz(const std::string& name) { return ends_with(name, ".tar.gz") || ends_with(name, ".tgz"); }

// ZIP record signatures
constexpr uint32_t SIG_LOCAL = 0x04034b50;
constexpr uint32_t SIG_CENTRAL = 0x02014b50;
constexpr uint32_t SIG_EOCD = 0x06054b50;
constexpr size_t EOCD_SIZE = 22;
constexpr size_t CENTRAL_SIZE = 46;
constexpr size_t LOCAL_SIZE = 30;

// TAR header field offsets
constexpr size_t TAR_NAME = 0;
constexpr size_t TAR_SIZE = 124;
constexpr size_t TAR_CHKSUM = 148;
constexpr size_t TAR_TYPE = 156;
constexpr size_t TAR_MAGIC = 257;
constexpr size_t TAR_PREFIX = 345;

std::string field_string(const uint8_t* p, size_t len) {
    size_t n = 0;
    while (n < len && p[n] != 0) ++n;
    return std::string(reinterpret_cast<const char*>(p), n);
}

uint64_t parse_numeric(const uint8_t* p, size_t len) {
    // GNU base-256: high bit of the first byte set
    if (p[0] & 0x80) {
        uint64_t value = p[0] & 0x7f;
        for (size_t i = 1; i < len; ++i) {
            if (value > (UINT64_MAX >> 8)) corrupt("tar: numeric field overflow");
            value = (value << 8) | p[i];
        }
        return value;
    }
    uint64_t value = 0;
    size_t i = 0;
    while (i < len && (p[i] == ' ' || p[i] == 0)) ++i;
    for (; i < len && p[i] != ' ' && p[i] != 0; ++i) {
        if (p[i] < '0' || p[i] > '7') corrupt("tar: malformed octal field");
        value = (value << 3) | static_cast<uint64_t>(p[i] - '0');
    }
    return value;
}

bool is_zero_block(const uint8_t* p) {
    return std::all_of(p, p + TarGzReader::BLOCK_SIZE, [](uint8_t b) { return b == 0; });
}

bool checksum_ok(const uint8_t* header) {
    uint64_t expected = parse_numeric(header + TAR_CHKSUM, 8);
    uint64_t sum = 0;
    for (size_t i = 0; i < TarGzReader::BLOCK_SIZE; ++i) {
        bool in_field = i >= TAR_CHKSUM && i < TAR_CHKSUM + 8;
        sum += in_field ? static_cast<uint8_t>(' ') : header[i];
    }
    return sum == expected;
}

// pax extended header: "<len> <key>=<value>\n" records
std::string pax_path(const uint8_t* data, size_t len) {
    std::string path;
    size_t pos = 0;
    while (pos < len) {
        size_t space = pos;
        while (space < len && data[space] != ' ') ++space;
        if (space >= len) corrupt("tar: malformed pax record");
        size_t record_len = 0;
        for (size_t i = pos; i < space; ++i) {
            if (data[i] < '0' || data[i] > '9') corrupt("tar: malformed pax record length");
            if (record_len > len) corrupt("tar: pax record overruns header");
            record_len = record_len * 10 + static_cast<size_t>(data[i] - '0');
        }
        // The length counts its own digits and the separating space.
        if (record_len <= space - pos + 1) corrupt("tar: pax record shorter than its length prefix");
        if (record_len > len - pos) corrupt("tar: pax record overruns header");

        std::string record(reinterpret_cast<const char*>(data + space + 1), pos + record_len - space - 1);
        if (!record.empty() && record.back() == '\n') record.pop_back();
        size_t eq = record.find('=');
        if (eq != std::string::npos && record.compare(0, eq, "path") == 0) {
            path = record.substr(eq + 1);
        }
        pos += record_len;
    }
    return path;
}

} // namespace

// ============================================================================
// ArchiveReader
// ============================================================================

bool ArchiveReader::is_supported(const std::filesystem::path& archive) {
    std::string name = lower_filename(archive);
    return is_zip(name) || is_targz(name);
}

std::unique_ptr<ArchiveReader> ArchiveReader::open(const std::filesystem::path& archive) {
    std::string name = lower_filename(archive);
    if (is_zip(name)) {
        return std::make_unique<ZipReader>(FileIO::read_bytes(archive));
    }
    if (is_targz(name)) {
        return std::make_unique<TarGzReader>(FileIO::read_bytes(archive));
    }
    throw ResolveError(ErrorKind::UnsupportedArchive,
                       "unsupported archive format: " + archive.filename().string() +
                       " (expected .zip, .tar.gz or .tgz)");
}

// ============================================================================
// ZipReader
// ============================================================================

ZipReader::ZipReader(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {
    const size_t size = bytes_.size();
    if (size < EOCD_SIZE) corrupt("zip: file too small");

    // End of central directory, searched backwards past a trailing comment.
    size_t eocd = size - EOCD_SIZE;
    size_t lowest = size > EOCD_SIZE + 0xFFFF ? size - EOCD_SIZE - 0xFFFF : 0;
    while (le32(&bytes_[eocd]) != SIG_EOCD) {
        if (eocd == lowest) corrupt("zip: end of central directory not found");
        --eocd;
    }

    const uint8_t* e = &bytes_[eocd];
    uint16_t count = le16(e + 10);
    uint32_t cd_size = le32(e + 12);
    uint32_t cd_offset = le32(e + 16);
    if (count == 0xFFFF || cd_size == 0xFFFFFFFF || cd_offset == 0xFFFFFFFF) {
        corrupt("zip: zip64 archives are not supported");
    }
    if (static_cast<uint64_t>(cd_offset) + cd_size > eocd) {
        corrupt("zip: central directory out of range");
    }

    size_t pos = cd_offset;
    for (uint16_t i = 0; i < count; ++i) {
        if (pos + CENTRAL_SIZE > eocd || le32(&bytes_[pos]) != SIG_CENTRAL) {
            corrupt("zip: bad central directory entry " + std::to_string(i));
        }
        const uint8_t* c = &bytes_[pos];
        uint16_t name_len = le16(c + 28);
        uint16_t extra_len = le16(c + 30);
        uint16_t comment_len = le16(c + 32);
        if (pos + CENTRAL_SIZE + name_len > eocd) corrupt("zip: entry name out of range");

        Record record{le16(c + 10), le16(c + 8), le32(c + 16), le32(c + 20), le32(c + 42)};
        uint32_t size_uncompressed = le32(c + 24);
        if (record.compressed_size == 0xFFFFFFFF || size_uncompressed == 0xFFFFFFFF ||
            record.local_offset == 0xFFFFFFFF) {
            corrupt("zip: zip64 entries are not supported");
        }

        ArchiveEntry entry;
        entry.path = std::string(reinterpret_cast<const char*>(c + CENTRAL_SIZE), name_len);
        std::replace(entry.path.begin(), entry.path.end(), '\\', '/');
        entry.regular_file = !entry.path.empty() && entry.path.back() != '/';
        entry.size = size_uncompressed;

        entries_.push_back(std::move(entry));
        records_.push_back(record);
        pos += CENTRAL_SIZE + name_len + extra_len + comment_len;
    }
}

std::vector<uint8_t> ZipReader::read(size_t index) const {
    if (index >= entries_.size()) corrupt("zip: entry index out of range");
    const ArchiveEntry& entry = entries_[index];
    const Record& record = records_[index];

    if (record.flags & 0x0001) {
        corrupt("zip: " + entry.path + " is encrypted");
    }

    size_t local = record.local_offset;
    if (local + LOCAL_SIZE > bytes_.size() || le32(&bytes_[local]) != SIG_LOCAL) {
        corrupt("zip: bad local header for " + entry.path);
    }
    size_t data_start = local + LOCAL_SIZE + le16(&bytes_[local + 26]) + le16(&bytes_[local + 28]);
    if (data_start + record.compressed_size > bytes_.size()) {
        corrupt("zip: data for " + entry.path + " out of range");
    }
    const uint8_t* data = bytes_.data() + data_start;

    std::vector<uint8_t> out;
    switch (record.method) {
        case 0:
            if (record.compressed_size != entry.size) corrupt("zip: stored size mismatch for " + entry.path);
            out.assign(data, data + record.compressed_size);
            break;
        case 8:
            out = Inflate::inflate_raw(data, record.compressed_size, static_cast<size_t>(entry.size));
            break;
        default:
            corrupt("zip: " + entry.path + " uses unsupported compression method " + std::to_string(record.method));
    }

    uLong crc = crc32(0L, Z_NULL, 0);
    if (!out.empty()) {
        crc = crc32(crc, out.data(), static_cast<uInt>(out.size()));
    }
    if (static_cast<uint32_t>(crc) != record.crc) {
        corrupt("zip: CRC-32 mismatch for " + entry.path);
    }
    return out;
}

// ============================================================================
// TarGzReader
// ============================================================================

TarGzReader::TarGzReader(const std::vector<uint8_t>& compressed) : tar_(Inflate::gunzip(compressed)) {
    std::string long_name;
    size_t pos = 0;

    while (pos + BLOCK_SIZE <= tar_.size()) {
        const uint8_t* header = &tar_[pos];
        if (is_zero_block(header)) break;
        if (!checksum_ok(header)) corrupt("tar: header checksum mismatch at offset " + std::to_string(pos));

        uint64_t size = parse_numeric(header + TAR_SIZE, 12);
        char type = static_cast<char>(header[TAR_TYPE]);
        size_t data_start = pos + BLOCK_SIZE;
        if (size > tar_.size() - data_start) corrupt("tar: entry data truncated");
        size_t padded = static_cast<size_t>((size + BLOCK_SIZE - 1) / BLOCK_SIZE * BLOCK_SIZE);

        if (type == 'L') {
            long_name = field_string(&tar_[data_start], static_cast<size_t>(size));
        } else if (type == 'x') {
            long_name = pax_path(&tar_[data_start], static_cast<size_t>(size));
        } else if (type == 'g') {
            // global pax defaults carry no per-entry names
        } else {
            std::string name;
            if (!long_name.empty()) {
                name = long_name;
            } else {
                name = field_string(header + TAR_NAME, 100);
                if (std::memcmp(header + TAR_MAGIC, "ustar", 5) == 0) {
                    std::string prefix = field_string(header + TAR_PREFIX, 155);
                    if (!prefix.empty()) name = prefix + "/" + name;
                }
            }
            long_name.clear();

            ArchiveEntry entry;
            entry.path = name;
            entry.regular_file = (type == '0' || type == '\0' || type == '7') &&
                                 !name.empty() && name.back() != '/';
            entry.size = size;
            entries_.push_back(std::move(entry));
            offsets_.push_back(data_start);
        }

        if (padded > tar_.size() - data_start) {
            // Final entry without block padding.
            break;
        }
        pos = data_start + padded;
    }
}

std::vector<uint8_t> TarGzReader::read(size_t index) const {
    if (index >= entries_.size()) corrupt("tar: entry index out of range");
    const uint8_t* start = tar_.data() + offsets_[index];
    return std::vector<uint8_t>(start, start + entries_[index].size);
}

} // namespace Prebuilt
