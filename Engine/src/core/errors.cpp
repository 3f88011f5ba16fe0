#include <core/errors.hpp>

namespace Prebuilt {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConfigInvalid:            return "invalid configuration";
        case ErrorKind::InputMissing:             return "missing build input";
        case ErrorKind::InputInvalid:             return "invalid build input";
        case ErrorKind::ManifestSignatureInvalid: return "manifest signature mismatch";
        case ErrorKind::ArtifactSignatureInvalid: return "artifact signature mismatch";
        case ErrorKind::ManifestInvalid:          return "malformed manifest";
        case ErrorKind::PlatformNotFound:         return "platform not in release";
        case ErrorKind::ArtifactNotFound:         return "no artifact for platform";
        case ErrorKind::LibraryNotFoundInArchive: return "library not found in archive";
        case ErrorKind::ArchiveInvalid:           return "corrupt archive";
        case ErrorKind::UnsupportedArchive:       return "unsupported archive type";
        case ErrorKind::NotFound:                 return "release file not found";
        case ErrorKind::NetworkError:             return "network error";
        case ErrorKind::IoError:                  return "filesystem error";
        case ErrorKind::ToolchainUnavailable:     return "toolchain unavailable";
    }
    return "unknown error";
}

} // namespace Prebuilt
