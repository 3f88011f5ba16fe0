#pragma once

#include <export.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace Prebuilt {

struct HttpResponse {
    long status = 0;
    std::vector<uint8_t> body;
};

/**
 * @brief Connection-level failure (DNS, refused, timeout, TLS).
 *
 * Distinct from an HTTP error status, which arrives as a normal response.
 */
class PREBUILT_API TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Minimal GET transport used by the cache.
 *
 * Implementations follow redirects and return the final status and body.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * @throws TransportError if no HTTP response was obtained
     */
    virtual HttpResponse get(const std::string& url) = 0;
};

} // namespace Prebuilt
