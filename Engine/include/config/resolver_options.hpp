#pragma once

#include <export.hpp>
#include <config/config_model.hpp>
#include <chrono>
#include <filesystem>
#include <optional>

namespace Prebuilt {

/**
 * @brief Retry schedule for release downloads.
 *
 * Attempt n (0-based) waits base_delay * 2^n before retrying, capped at
 * max_delay. max_retries counts retries, not attempts.
 */
struct PREBUILT_API RetryPolicy {
    int max_retries = 3;
    std::chrono::milliseconds base_delay{200};
    std::chrono::milliseconds max_delay{5000};

    std::chrono::milliseconds delay_for(int attempt) const;
};

/**
 * @brief Process-level knobs for a resolver run.
 *
 * Defaults suit a build hook; from_env() lets CI override them:
 *   PREBUILT_CACHE_DIR          cache root (default <project>/.prebuilt)
 *   PREBUILT_HTTP_TIMEOUT_SECS  per-request timeout (default 30)
 *   PREBUILT_HTTP_RETRIES       retries on transient failures (default 3)
 *   PREBUILT_MODE               overrides precompiled_binaries.mode
 */
struct PREBUILT_API ResolverOptions {
    std::optional<std::filesystem::path> cache_dir;
    std::chrono::seconds http_timeout{30};
    RetryPolicy retry;
    std::optional<PrecompiledMode> mode_override;

    /**
     * @throws ResolveError ConfigInvalid on a malformed variable
     */
    static ResolverOptions from_env();

    std::filesystem::path cache_root(const std::filesystem::path& project_dir) const {
        return cache_dir ? *cache_dir : project_dir / ".prebuilt";
    }
};

} // namespace Prebuilt
