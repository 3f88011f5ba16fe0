#include <release/release_clients.hpp>
#include <crypto/signature_verifier.hpp>

namespace Prebuilt {

std::vector<uint8_t> fetch_verified(CacheStore& cache,
                                    const PublicKey& public_key,
                                    const std::filesystem::path& local_path,
                                    const std::string& url,
                                    ErrorKind failure_kind) {
    std::filesystem::path sig_path = CacheStore::signature_path(local_path);

    std::vector<uint8_t> payload = cache.get_or_fetch(local_path, url);
    std::vector<uint8_t> signature = cache.get_or_fetch(sig_path, url + ".sig");

    SignatureVerifier verifier(public_key);
    if (!verifier.verify(payload, signature)) {
        CacheStore::evict(local_path);
        throw ResolveError(failure_kind,
                           local_path.filename().string() + ": Ed25519 signature does not match (" + url + ")");
    }
    return payload;
}

// ============================================================================
// ManifestClient
// ============================================================================

Manifest ManifestClient::fetch_verified_manifest(const std::string& build_id) {
    std::filesystem::path local = layout_.manifest_dir(build_id) / Manifest::FILE_NAME;
    std::string url = config_.file_url(build_id, Manifest::FILE_NAME);

    reporter_.step("Fetching manifest for " + build_id);
    std::vector<uint8_t> bytes =
        fetch_verified(cache_, config_.public_key, local, url, ErrorKind::ManifestSignatureInvalid);
    reporter_.debug("manifest signature verified");

    Manifest manifest = Manifest::parse(std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
    if (manifest.build_id && *manifest.build_id != build_id) {
        throw ResolveError(ErrorKind::ManifestInvalid,
                           "manifest declares build " + *manifest.build_id + ", expected " + build_id);
    }
    return manifest;
}

// ============================================================================
// PlatformMatcher
// ============================================================================

ArtifactSelection PlatformMatcher::select_artifact(const Manifest& manifest, const std::string& target_triple) {
    for (const auto& platform : manifest.platforms) {
        if (!platform.matches(target_triple)) continue;

        if (platform.artifacts.empty()) {
            throw ResolveError(ErrorKind::ArtifactNotFound,
                               "manifest platform \"" + platform.name + "\" has no artifacts");
        }
        return ArtifactSelection{platform, platform.artifacts.front()};
    }
    throw ResolveError(ErrorKind::PlatformNotFound, "no manifest platform matches target " + target_triple);
}

// ============================================================================
// ArtifactClient
// ============================================================================

bool ArtifactClient::is_safe_file_name(const std::string& name) {
    return !name.empty() &&
           name.find('/') == std::string::npos &&
           name.find('\\') == std::string::npos &&
           name.find("..") == std::string::npos;
}

std::filesystem::path ArtifactClient::fetch_verified_artifact(const std::string& build_id,
                                                              const std::string& artifact_name) {
    if (!is_safe_file_name(artifact_name)) {
        throw ResolveError(ErrorKind::ManifestInvalid, "unsafe artifact name \"" + artifact_name + "\"");
    }

    std::filesystem::path local = layout_.artifact_dir(build_id) / artifact_name;
    std::string url = config_.file_url(build_id, artifact_name);

    reporter_.step("Fetching artifact " + artifact_name);
    fetch_verified(cache_, config_.public_key, local, url, ErrorKind::ArtifactSignatureInvalid);
    reporter_.debug("artifact signature verified");
    return local;
}

} // namespace Prebuilt
