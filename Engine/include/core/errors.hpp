/**
 * @file errors.hpp
 * @brief Failure taxonomy for precompiled-artifact resolution
 */

#pragma once

#include <export.hpp>
#include <stdexcept>
#include <string>

namespace Prebuilt {

/**
 * @brief Concrete cause of a failed resolution step.
 *
 * There is no kind for a missing config: the fallback policy routes that
 * case to a local build.
 */
enum class ErrorKind {
    ConfigInvalid,
    InputMissing,
    InputInvalid,
    ManifestSignatureInvalid,
    ArtifactSignatureInvalid,
    ManifestInvalid,
    PlatformNotFound,
    ArtifactNotFound,
    LibraryNotFoundInArchive,
    ArchiveInvalid,
    UnsupportedArchive,
    NotFound,
    NetworkError,
    IoError,
    ToolchainUnavailable
};

PREBUILT_API const char* to_string(ErrorKind kind);

/**
 * @brief Exception thrown by every engine component.
 *
 * Callers switch on kind() instead of matching message text. The stage that
 * was running is attached by the fallback policy when it reports the failure.
 */
class PREBUILT_API ResolveError : public std::runtime_error {
public:
    ResolveError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace Prebuilt
