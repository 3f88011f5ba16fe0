#include <storage/cache_store.hpp>
#include <storage/file_io.hpp>
#include <core/errors.hpp>
#include <thread>

namespace Prebuilt {

namespace {

bool is_transient(long status) {
    return status == 408 || status == 429 || (status >= 500 && status <= 599);
}

} // namespace

std::vector<uint8_t> CacheStore::get_or_fetch(const std::filesystem::path& local_path, const std::string& url) {
    if (FileIO::is_regular_file(local_path)) {
        reporter_.debug("cache hit " + local_path.string());
        return FileIO::read_bytes(local_path);
    }

    reporter_.debug("GET " + url);
    std::vector<uint8_t> body = download(url);
    FileIO::write_atomic(local_path, body);
    return body;
}

std::vector<uint8_t> CacheStore::download(const std::string& url) {
    std::string last_failure;

    for (int attempt = 0; attempt <= retry_.max_retries; ++attempt) {
        if (attempt > 0) {
            auto delay = retry_.delay_for(attempt - 1);
            reporter_.debug("retrying " + url + " in " + std::to_string(delay.count()) + "ms (" + last_failure + ")");
            std::this_thread::sleep_for(delay);
        }

        HttpResponse response;
        try {
            response = http_.get(url);
        } catch (const TransportError& e) {
            last_failure = e.what();
            continue;
        }

        if (response.status >= 200 && response.status <= 299) {
            return std::move(response.body);
        }
        if (response.status == 404 || response.status == 410) {
            throw ResolveError(ErrorKind::NotFound, "HTTP " + std::to_string(response.status) + " for " + url);
        }
        if (!is_transient(response.status)) {
            throw ResolveError(ErrorKind::NetworkError, "HTTP " + std::to_string(response.status) + " for " + url);
        }
        last_failure = "HTTP " + std::to_string(response.status);
    }

    throw ResolveError(ErrorKind::NetworkError,
                       "giving up on " + url + " after " + std::to_string(retry_.max_retries + 1) +
                       " attempts: " + last_failure);
}

void CacheStore::evict(const std::filesystem::path& payload) {
    FileIO::remove_if_exists(payload);
    FileIO::remove_if_exists(signature_path(payload));
}

} // namespace Prebuilt
