#pragma once

#include <net/http_client.hpp>
#include <export.hpp>
#include <chrono>

namespace Prebuilt {

/**
 * @brief libcurl-backed HttpClient.
 *
 * One easy handle per request; safe to share across threads. file:// URLs
 * are accepted so releases can be mirrored on a local or network filesystem.
 */
class PREBUILT_API CurlHttpClient : public HttpClient {
public:
    static constexpr long MAX_REDIRECTS = 10;

    explicit CurlHttpClient(std::chrono::seconds timeout = std::chrono::seconds(30));

    HttpResponse get(const std::string& url) override;

private:
    std::chrono::seconds timeout_;
};

} // namespace Prebuilt
