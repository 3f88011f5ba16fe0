#include <resolve/fallback_policy.hpp>
#include <archive/archive_extractor.hpp>
#include <archive/archive_reader.hpp>
#include <hashing/build_identity.hpp>
#include <platform/target_platform.hpp>
#include <release/release_clients.hpp>
#include <storage/cache_layout.hpp>
#include <storage/cache_store.hpp>

namespace Prebuilt {

namespace {

// Failures that say the local setup is wrong rather than the release; a
// local build would not fix them, so they are fatal in every mode.
bool is_configuration_error(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConfigInvalid:
        case ErrorKind::InputMissing:
        case ErrorKind::InputInvalid:
        case ErrorKind::UnsupportedArchive:
            return true;
        case ErrorKind::ManifestSignatureInvalid:
        case ErrorKind::ArtifactSignatureInvalid:
        case ErrorKind::ManifestInvalid:
        case ErrorKind::PlatformNotFound:
        case ErrorKind::ArtifactNotFound:
        case ErrorKind::LibraryNotFoundInArchive:
        case ErrorKind::ArchiveInvalid:
        case ErrorKind::NotFound:
        case ErrorKind::NetworkError:
        case ErrorKind::IoError:
        case ErrorKind::ToolchainUnavailable:
            return false;
    }
    return false;
}

} // namespace

const char* to_string(Resolution::Kind kind) {
    switch (kind) {
        case Resolution::Kind::Downloaded: return "downloaded";
        case Resolution::Kind::Fallback:   return "fallback";
        case Resolution::Kind::Fatal:      return "fatal";
    }
    return "fatal";
}

Resolution FallbackPolicy::fatal(Resolution base, ErrorKind kind, const std::string& reason) {
    base.kind = Resolution::Kind::Fatal;
    base.error = kind;
    base.reason = reason;
    reporter_.error(reason);
    return base;
}

Resolution FallbackPolicy::fallback(Resolution base, std::optional<ErrorKind> kind, const std::string& reason) {
    base.kind = Resolution::Kind::Fallback;
    base.error = kind;
    base.reason = reason;
    if (kind) {
        reporter_.warn(reason + "; falling back to local build");
    } else {
        reporter_.info(reason + "; building locally");
    }
    return base;
}

Resolution FallbackPolicy::stage_failure(Resolution base, const char* stage, const ResolveError& error,
                                         PrecompiledMode mode) {
    std::string reason = std::string(stage) + ": " + to_string(error.kind()) + ": " + error.what();

    if (is_configuration_error(error.kind())) {
        return fatal(std::move(base), error.kind(), reason);
    }
    if (mode == PrecompiledMode::Always) {
        return fatal(std::move(base), error.kind(), "precompiled binaries are required (mode=always): " + reason);
    }
    if (toolchain_.available()) {
        return fallback(std::move(base), error.kind(), reason);
    }
    return fatal(std::move(base), ErrorKind::ToolchainUnavailable, reason + "; local build toolchain unavailable");
}

Resolution FallbackPolicy::resolve(const ResolveRequest& request) {
    Resolution result;
    result.target_triple = request.target_triple;

    // --- config ---
    std::optional<PrecompiledConfig> config;
    try {
        if (result.target_triple.empty()) {
            result.target_triple = TargetPlatform::detect_host_triple();
        }
        config = ConfigModel::load(request.project_dir);
    } catch (const ResolveError& e) {
        return fatal(std::move(result), e.kind(), std::string("config: ") + e.what());
    }

    if (!config) {
        return fallback(std::move(result), std::nullopt,
                        std::string("no config: ") + ConfigModel::CONFIG_FILE + " has no " +
                        ConfigModel::SECTION + " section");
    }

    PrecompiledMode mode = config->mode;
    if (options_.mode_override) mode = *options_.mode_override;
    if (request.mode_override) mode = *request.mode_override;

    if (mode == PrecompiledMode::Never) {
        return fallback(std::move(result), std::nullopt, "mode=never");
    }

    // --- build-id ---
    try {
        if (request.build_id) {
            if (!BuildIdentityHasher::is_valid_build_id(*request.build_id)) {
                throw ResolveError(ErrorKind::ConfigInvalid, "invalid build id \"" + *request.build_id + "\"");
            }
            result.build_id = *request.build_id;
        } else {
            result.build_id = BuildIdentityHasher::compute_build_id(request.project_dir, request.interface_definition);
        }
    } catch (const ResolveError& e) {
        return fatal(std::move(result), e.kind(), std::string("build-id: ") + e.what());
    }
    reporter_.info("Build id " + result.build_id + " for " + result.target_triple);

    std::string extension = request.library_extension.empty()
                                ? TargetPlatform::library_extension(result.target_triple, request.link_mode)
                                : request.library_extension;

    CacheLayout layout{options_.cache_root(request.project_dir)};
    CacheStore cache(http_, options_.retry, reporter_);

    const char* stage = "manifest";
    try {
        ManifestClient manifests(*config, cache, layout, reporter_);
        Manifest manifest = manifests.fetch_verified_manifest(result.build_id);

        stage = "platform";
        ArtifactSelection selection = PlatformMatcher::select_artifact(manifest, result.target_triple);
        result.artifact_name = selection.artifact_name;

        stage = "artifact";
        if (!ArchiveReader::is_supported(selection.artifact_name)) {
            throw ResolveError(ErrorKind::UnsupportedArchive,
                               "artifact \"" + selection.artifact_name + "\" is not a .zip, .tar.gz or .tgz archive");
        }
        ArtifactClient artifacts(*config, cache, layout, reporter_);
        auto archive = artifacts.fetch_verified_artifact(result.build_id, selection.artifact_name);

        stage = "extract";
        ArchiveExtractor extractor(layout.extraction_dir(result.build_id, result.target_triple), reporter_);
        result.library = extractor.extract_library(archive, extension);
    } catch (const ResolveError& e) {
        return stage_failure(std::move(result), stage, e, mode);
    }

    result.kind = Resolution::Kind::Downloaded;
    reporter_.success("Using precompiled " + result.library.string());
    return result;
}

} // namespace Prebuilt
