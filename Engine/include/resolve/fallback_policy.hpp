/**
 * @file fallback_policy.hpp
 * @brief Decides between a verified download, a local build, or failure
 */

#pragma once

#include <config/config_model.hpp>
#include <config/resolver_options.hpp>
#include <core/errors.hpp>
#include <net/http_client.hpp>
#include <platform/target_platform.hpp>
#include <resolve/toolchain_probe.hpp>
#include <utils/logger.hpp>
#include <export.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace Prebuilt {

/**
 * @brief Terminal outcome of one resolution. Never persisted.
 */
struct PREBUILT_API Resolution {
    enum class Kind {
        Downloaded,  ///< library holds the verified, extracted file
        Fallback,    ///< caller should build locally; reason says why
        Fatal        ///< neither path is possible; error says why
    };

    Kind kind = Kind::Fatal;
    std::filesystem::path library;
    std::string reason;
    std::optional<ErrorKind> error;

    // Filled in as far as resolution got
    std::string build_id;
    std::string target_triple;
    std::string artifact_name;

    bool downloaded() const { return kind == Kind::Downloaded; }
    bool needs_fallback() const { return kind == Kind::Fallback; }
    bool fatal() const { return kind == Kind::Fatal; }
};

PREBUILT_API const char* to_string(Resolution::Kind kind);

struct PREBUILT_API ResolveRequest {
    std::filesystem::path project_dir;
    std::string target_triple;                    ///< empty: host triple
    std::string library_extension;                ///< empty: derived from the triple and link mode
    LinkMode link_mode = LinkMode::Dynamic;
    std::optional<std::string> build_id;          ///< skips hashing when set
    std::optional<std::filesystem::path> interface_definition;
    std::optional<PrecompiledMode> mode_override; ///< wins over config and environment
};

/**
 * @brief Resolution state machine.
 *
 * config -> build-id -> manifest -> platform -> artifact -> extract, each
 * step fed by the previous one. A missing config or mode=never returns
 * before any network access. A failed download step falls back to a local
 * build unless mode=always or no toolchain is installed.
 */
class PREBUILT_API FallbackPolicy {
public:
    FallbackPolicy(HttpClient& http, const ToolchainProbe& toolchain, ResolverOptions options, Reporter& reporter)
        : http_(http), toolchain_(toolchain), options_(std::move(options)), reporter_(reporter) {}

    Resolution resolve(const ResolveRequest& request);

private:
    Resolution stage_failure(Resolution base, const char* stage, const ResolveError& error, PrecompiledMode mode);
    Resolution fatal(Resolution base, ErrorKind kind, const std::string& reason);
    Resolution fallback(Resolution base, std::optional<ErrorKind> kind, const std::string& reason);

    HttpClient& http_;
    const ToolchainProbe& toolchain_;
    ResolverOptions options_;
    Reporter& reporter_;
};

} // namespace Prebuilt
