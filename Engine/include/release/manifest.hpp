/**
 * @file manifest.hpp
 * @brief Release manifest model (xforge-manifest.json)
 */

#pragma once

#include <export.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Prebuilt {

/**
 * @brief One platform a release was built for.
 */
struct PREBUILT_API PlatformEntry {
    std::string name;
    std::vector<std::string> triples;
    std::vector<std::string> artifacts;

    bool matches(const std::string& target_triple) const;
};

/**
 * @brief Parsed manifest, platforms in manifest order.
 *
 * Three layouts of "platforms" are accepted and normalized here:
 *   [ {entry}, ... ]
 *   { "targets": [ {entry}, ... ] }
 *   { "<key>": {entry}, ... }          (document order; name defaults to key)
 */
struct PREBUILT_API Manifest {
    static constexpr const char* FILE_NAME = "xforge-manifest.json";

    std::optional<std::string> build_id;
    std::vector<PlatformEntry> platforms;

    /**
     * @brief Parse manifest JSON text. Call only on verified bytes.
     * @throws ResolveError ManifestInvalid on malformed JSON or shape
     */
    static Manifest parse(std::string_view json_text);
};

} // namespace Prebuilt
