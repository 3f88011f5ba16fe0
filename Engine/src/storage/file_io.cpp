#include <storage/file_io.hpp>
#include <core/errors.hpp>
#include <utils/hex.hpp>
#include <fstream>
#include <iterator>
#include <random>
#include <system_error>

namespace Prebuilt {

namespace fs = std::filesystem;

namespace {

std::string temp_suffix() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    uint64_t value = rng();
    uint8_t bytes[8];
    for (int i = 0; i < 8; ++i) bytes[i] = static_cast<uint8_t>(value >> (i * 8));
    return encode_hex(bytes, sizeof(bytes));
}

} // namespace

std::vector<uint8_t> FileIO::read_bytes(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ResolveError(ErrorKind::IoError, "cannot open " + path.string());
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw ResolveError(ErrorKind::IoError, "read error on " + path.string());
    }
    return data;
}

std::string FileIO::read_text(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ResolveError(ErrorKind::IoError, "cannot open " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw ResolveError(ErrorKind::IoError, "read error on " + path.string());
    }
    return text;
}

void FileIO::write_atomic(const fs::path& path, const uint8_t* data, size_t len) {
    std::error_code ec;
    fs::path parent = path.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw ResolveError(ErrorKind::IoError,
                               "cannot create directory " + parent.string() + ": " + ec.message());
        }
    }

    // Leading dot keeps half-written files out of extension-based lookups.
    fs::path tmp = parent / ("." + path.filename().string() + ".tmp-" + temp_suffix());
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw ResolveError(ErrorKind::IoError, "cannot create " + tmp.string());
        }
        out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            throw ResolveError(ErrorKind::IoError, "write failed for " + tmp.string());
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw ResolveError(ErrorKind::IoError,
                           "cannot move " + tmp.string() + " into place: " + ec.message());
    }
}

bool FileIO::remove_if_exists(const fs::path& path) {
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        throw ResolveError(ErrorKind::IoError, "cannot remove " + path.string() + ": " + ec.message());
    }
    return removed;
}

bool FileIO::is_regular_file(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

} // namespace Prebuilt
