#include <archive/inflate.hpp>
#include <core/errors.hpp>
#include <climits>
#include <string>
#include <zlib.h>

namespace Prebuilt {

namespace {

constexpr size_t CHUNK = 64 * 1024;

struct InflateGuard {
    z_stream* stream;
    ~InflateGuard() { inflateEnd(stream); }
};

[[noreturn]] void corrupt(const std::string& what, const z_stream& stream) {
    std::string detail = stream.msg ? stream.msg : "unexpected end of stream";
    throw ResolveError(ErrorKind::ArchiveInvalid, what + ": " + detail);
}

void check_input_size(size_t len) {
    if (len > UINT_MAX) {
        throw ResolveError(ErrorKind::ArchiveInvalid, "compressed stream too large");
    }
}

} // namespace

std::vector<uint8_t> Inflate::gunzip(const uint8_t* data, size_t len) {
    check_input_size(len);

    z_stream stream{};
    if (inflateInit2(&stream, 16 + MAX_WBITS) != Z_OK) {
        throw ResolveError(ErrorKind::ArchiveInvalid, "inflateInit2 failed");
    }
    InflateGuard guard{&stream};

    stream.next_in = const_cast<Bytef*>(data);
    stream.avail_in = static_cast<uInt>(len);

    std::vector<uint8_t> out;
    uint8_t chunk[CHUNK];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        stream.next_out = chunk;
        stream.avail_out = static_cast<uInt>(CHUNK);
        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            corrupt("gzip", stream);
        }
        out.insert(out.end(), chunk, chunk + (CHUNK - stream.avail_out));
        if (ret == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
            corrupt("gzip", stream);
        }
    }
    return out;
}

std::vector<uint8_t> Inflate::inflate_raw(const uint8_t* data, size_t len, size_t expected_size) {
    check_input_size(len);
    if (expected_size >= UINT_MAX) {
        throw ResolveError(ErrorKind::ArchiveInvalid, "deflate entry too large");
    }

    // Deflate cannot expand input by more than about 1032:1.
    if (expected_size / 1032 > len + 1) {
        throw ResolveError(ErrorKind::ArchiveInvalid,
                           "deflate entry claims " + std::to_string(expected_size) + " bytes from " +
                           std::to_string(len) + " compressed");
    }

    z_stream stream{};
    if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
        throw ResolveError(ErrorKind::ArchiveInvalid, "inflateInit2 failed");
    }
    InflateGuard guard{&stream};

    // One spare byte detects streams longer than declared.
    std::vector<uint8_t> out(expected_size + 1);
    stream.next_in = const_cast<Bytef*>(data);
    stream.avail_in = static_cast<uInt>(len);
    stream.next_out = out.data();
    stream.avail_out = static_cast<uInt>(out.size());

    int ret = inflate(&stream, Z_FINISH);
    if (ret != Z_STREAM_END) {
        corrupt("deflate", stream);
    }
    if (stream.total_out != expected_size) {
        throw ResolveError(ErrorKind::ArchiveInvalid,
                           "deflate size mismatch: expected " + std::to_string(expected_size) +
                           ", got " + std::to_string(stream.total_out));
    }
    out.resize(expected_size);
    return out;
}

} // namespace Prebuilt
