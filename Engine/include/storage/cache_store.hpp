#pragma once

#include <config/resolver_options.hpp>
#include <net/http_client.hpp>
#include <utils/logger.hpp>
#include <export.hpp>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace Prebuilt {

/**
 * @brief Download-once file cache with bounded retries.
 *
 * Files are written atomically, so concurrent processes sharing a cache root
 * only ever see complete files. The store never validates content; callers
 * verify and evict.
 */
class PREBUILT_API CacheStore {
public:
    CacheStore(HttpClient& http, RetryPolicy retry, Reporter& reporter)
        : http_(http), retry_(retry), reporter_(reporter) {}

    /**
     * @brief Bytes of local_path, downloading url into it first if absent.
     *
     * Retries transport errors, 408, 429 and 5xx with exponential backoff.
     *
     * @throws ResolveError NotFound on 404/410, NetworkError on any other
     *         failure, IoError if the file cannot be written
     */
    std::vector<uint8_t> get_or_fetch(const std::filesystem::path& local_path, const std::string& url);

    /**
     * @brief Remove a cached payload and its detached signature.
     */
    static void evict(const std::filesystem::path& payload);

    static std::filesystem::path signature_path(const std::filesystem::path& payload) {
        std::filesystem::path sig = payload;
        sig += ".sig";
        return sig;
    }

private:
    std::vector<uint8_t> download(const std::string& url);

    HttpClient& http_;
    RetryPolicy retry_;
    Reporter& reporter_;
};

} // namespace Prebuilt
