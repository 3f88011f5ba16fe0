/**
 * @file release_clients.hpp
 * @brief Signed downloads of release manifests and artifacts
 */

#pragma once

#include <config/config_model.hpp>
#include <core/errors.hpp>
#include <release/manifest.hpp>
#include <storage/cache_layout.hpp>
#include <storage/cache_store.hpp>
#include <utils/logger.hpp>
#include <export.hpp>
#include <filesystem>
#include <string>

namespace Prebuilt {

/**
 * @brief Fetch a payload and its detached signature through the cache and
 *        verify them.
 *
 * On a signature mismatch both cached files are deleted, including ones that
 * were already on disk before this call, so the next attempt downloads fresh
 * copies.
 *
 * @throws ResolveError failure_kind on mismatch; NotFound, NetworkError or
 *         IoError from the cache
 */
PREBUILT_API std::vector<uint8_t> fetch_verified(CacheStore& cache,
                                                 const PublicKey& public_key,
                                                 const std::filesystem::path& local_path,
                                                 const std::string& url,
                                                 ErrorKind failure_kind);

class PREBUILT_API ManifestClient {
public:
    ManifestClient(const PrecompiledConfig& config, CacheStore& cache, CacheLayout layout, Reporter& reporter)
        : config_(config), cache_(cache), layout_(std::move(layout)), reporter_(reporter) {}

    /**
     * @brief Download (or reuse), verify, then parse the manifest for build_id.
     * @throws ResolveError ManifestSignatureInvalid, ManifestInvalid, NotFound,
     *         NetworkError
     */
    Manifest fetch_verified_manifest(const std::string& build_id);

private:
    const PrecompiledConfig& config_;
    CacheStore& cache_;
    CacheLayout layout_;
    Reporter& reporter_;
};

struct ArtifactSelection {
    PlatformEntry platform;
    std::string artifact_name;
};

class PREBUILT_API PlatformMatcher {
public:
    /**
     * @brief First entry (in manifest order) whose name or triples contain
     *        target_triple, and its first artifact.
     * @throws ResolveError PlatformNotFound, ArtifactNotFound
     */
    static ArtifactSelection select_artifact(const Manifest& manifest, const std::string& target_triple);
};

class PREBUILT_API ArtifactClient {
public:
    ArtifactClient(const PrecompiledConfig& config, CacheStore& cache, CacheLayout layout, Reporter& reporter)
        : config_(config), cache_(cache), layout_(std::move(layout)), reporter_(reporter) {}

    /**
     * @brief Verified archive on disk under the artifact cache directory.
     * @throws ResolveError ArtifactSignatureInvalid, ManifestInvalid (unsafe
     *         name), NotFound, NetworkError
     */
    std::filesystem::path fetch_verified_artifact(const std::string& build_id, const std::string& artifact_name);

    static bool is_safe_file_name(const std::string& name);

private:
    const PrecompiledConfig& config_;
    CacheStore& cache_;
    CacheLayout layout_;
    Reporter& reporter_;
};

} // namespace Prebuilt
