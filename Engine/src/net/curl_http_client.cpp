#include <net/curl_http_client.hpp>
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace Prebuilt {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

size_t write_body(char* data, size_t size, size_t count, void* user) {
    auto* body = static_cast<std::vector<uint8_t>*>(user);
    size_t len = size * count;
    body->insert(body->end(), reinterpret_cast<uint8_t*>(data), reinterpret_cast<uint8_t*>(data) + len);
    return len;
}

void global_init() {
    static std::once_flag once;
    std::call_once(once, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw TransportError(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
        }
    });
}

bool is_file_url(const std::string& url) {
    return url.compare(0, 7, "file://") == 0;
}

} // namespace

CurlHttpClient::CurlHttpClient(std::chrono::seconds timeout) : timeout_(timeout) {
    global_init();
}

HttpResponse CurlHttpClient::get(const std::string& url) {
    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) {
        throw TransportError("curl_easy_init failed");
    }

    HttpResponse response;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, MAX_REDIRECTS);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "prebuilt-resolver/1.0");
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    CURLcode rc = curl_easy_perform(curl.get());

    if (rc == CURLE_FILE_COULDNT_READ_FILE && is_file_url(url)) {
        response.status = 404;
        response.body.clear();
        return response;
    }
    if (rc != CURLE_OK) {
        std::string detail = error_buffer[0] ? error_buffer : curl_easy_strerror(rc);
        throw TransportError("GET " + url + ": " + detail);
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    // Non-HTTP schemes report no response code on success.
    if (response.status == 0 && is_file_url(url)) {
        response.status = 200;
    }
    return response;
}

} // namespace Prebuilt
