/**
 * @file config_model.hpp
 * @brief Typed precompiled-binaries settings read from xforge.yaml
 */

#pragma once

#include <crypto/signature_verifier.hpp>
#include <export.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace Prebuilt {

/**
 * @brief How hard the resolver tries before handing over to a local build.
 */
enum class PrecompiledMode {
    Auto,    ///< download when possible, fall back to a local build otherwise
    Always,  ///< a missing or broken release is fatal
    Never    ///< always build locally, no network access
};

PREBUILT_API const char* to_string(PrecompiledMode mode);

/**
 * @brief Parse a mode name, case-insensitive.
 *
 * Aliases: download -> always; build, off, disabled -> never.
 */
PREBUILT_API std::optional<PrecompiledMode> parse_mode(std::string_view raw);

/**
 * @brief Normalize "owner/repo", "github.com/owner/repo" or a full https URL.
 * @return nullopt unless exactly two non-empty segments remain
 */
PREBUILT_API std::optional<std::string> normalize_repository(std::string_view raw);

struct PREBUILT_API PrecompiledConfig {
    std::string repository;               ///< always "owner/repo"
    PublicKey public_key{};               ///< always 32 bytes
    std::optional<std::string> url_prefix;
    PrecompiledMode mode = PrecompiledMode::Auto;

    /**
     * @brief "<url_prefix><build_id>/<file_name>", or the GitHub release
     *        download URL when no prefix is configured.
     */
    std::string file_url(const std::string& build_id, const std::string& file_name) const;
};

class PREBUILT_API ConfigModel {
public:
    static constexpr const char* CONFIG_FILE = "xforge.yaml";
    static constexpr const char* SECTION = "precompiled_binaries";
    static constexpr const char* DEFAULT_HOST = "github.com";

    /**
     * @brief Load the precompiled_binaries section of <project_dir>/xforge.yaml.
     *
     * @return nullopt when the file or the section is absent
     * @throws ResolveError ConfigInvalid for any malformed field
     */
    static std::optional<PrecompiledConfig> load(const std::filesystem::path& project_dir);

    /**
     * @brief Same as load(), from YAML text already in memory.
     */
    static std::optional<PrecompiledConfig> parse(const std::string& yaml_text);
};

} // namespace Prebuilt
