/**
 * @file sha256_pipeline.cpp
 * @brief SHA-256 hashing implementation
 */

#include <hashing/sha256_pipeline.hpp>
#include <core/errors.hpp>
#include <utils/hex.hpp>
#include <openssl/evp.h>
#include <fstream>
#include <memory>

namespace Prebuilt {

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

EvpMdCtxPtr new_sha256_ctx() {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    return ctx;
}

SHA256Pipeline::Hash finish(EVP_MD_CTX* ctx) {
    SHA256Pipeline::Hash result{};
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx, result.data(), &out_len) != 1 || out_len != SHA256Pipeline::HASH_SIZE) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return result;
}

} // namespace

SHA256Pipeline::Hash SHA256Pipeline::hash(const void* data, size_t len) {
    auto ctx = new_sha256_ctx();
    if (len > 0 && EVP_DigestUpdate(ctx.get(), data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return finish(ctx.get());
}

SHA256Pipeline::Hash SHA256Pipeline::hash_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ResolveError(ErrorKind::IoError, "cannot open " + path.string() + " for hashing");
    }

    auto ctx = new_sha256_ctx();
    std::vector<char> buf(1 << 16);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize n = in.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
    }
    if (in.bad()) {
        throw ResolveError(ErrorKind::IoError, "read error while hashing " + path.string());
    }
    return finish(ctx.get());
}

std::string SHA256Pipeline::to_hex(const Hash& hash) {
    return encode_hex(hash.data(), hash.size());
}

} // namespace Prebuilt
