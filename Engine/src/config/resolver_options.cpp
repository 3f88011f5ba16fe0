#include <config/resolver_options.hpp>
#include <core/errors.hpp>
#include <algorithm>
#include <cstdlib>
#include <string>

namespace Prebuilt {

namespace {

std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) return std::nullopt;
    return std::string(value);
}

long parse_integer(const char* name, const std::string& raw, long min, long max) {
    size_t consumed = 0;
    long value = 0;
    try {
        value = std::stol(raw, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != raw.size() || value < min || value > max) {
        throw ResolveError(ErrorKind::ConfigInvalid,
                           std::string(name) + " must be an integer in [" + std::to_string(min) + ", " +
                           std::to_string(max) + "], got '" + raw + "'");
    }
    return value;
}

} // namespace

std::chrono::milliseconds RetryPolicy::delay_for(int attempt) const {
    auto delay = base_delay;
    for (int i = 0; i < attempt && delay < max_delay; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_delay);
}

ResolverOptions ResolverOptions::from_env() {
    ResolverOptions options;

    if (auto dir = env("PREBUILT_CACHE_DIR")) {
        options.cache_dir = std::filesystem::path(*dir);
    }
    if (auto timeout = env("PREBUILT_HTTP_TIMEOUT_SECS")) {
        options.http_timeout = std::chrono::seconds(parse_integer("PREBUILT_HTTP_TIMEOUT_SECS", *timeout, 1, 3600));
    }
    if (auto retries = env("PREBUILT_HTTP_RETRIES")) {
        options.retry.max_retries = static_cast<int>(parse_integer("PREBUILT_HTTP_RETRIES", *retries, 0, 10));
    }
    if (auto mode = env("PREBUILT_MODE")) {
        options.mode_override = parse_mode(*mode);
        if (!options.mode_override) {
            throw ResolveError(ErrorKind::ConfigInvalid,
                               "PREBUILT_MODE must be one of: auto, always, never, got '" + *mode + "'");
        }
    }

    return options;
}

} // namespace Prebuilt
