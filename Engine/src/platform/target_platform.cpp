#include <platform/target_platform.hpp>
#include <core/errors.hpp>

namespace Prebuilt {

std::string TargetPlatform::detect_host_triple() {
#if defined(__x86_64__) || defined(_M_X64)
    const std::string arch = "x86_64";
#elif defined(__aarch64__) || defined(_M_ARM64)
    const std::string arch = "aarch64";
#elif defined(__i386__) || defined(_M_IX86)
    const std::string arch = "i686";
#elif defined(__arm__)
    const std::string arch = "armv7";
#elif defined(__riscv) && __riscv_xlen == 64
    const std::string arch = "riscv64gc";
#else
    const std::string arch;
#endif

    if (arch.empty()) {
        throw ResolveError(ErrorKind::ConfigInvalid, "unsupported host architecture; pass a target triple explicitly");
    }

#if defined(__APPLE__)
    return arch + "-apple-darwin";
#elif defined(_WIN32)
#  if defined(__MINGW32__)
    return arch + "-pc-windows-gnu";
#  else
    return arch + "-pc-windows-msvc";
#  endif
#elif defined(__ANDROID__)
    return arch + (arch == "armv7" ? "-linux-androideabi" : "-linux-android");
#elif defined(__linux__)
#  if defined(__arm__)
    return arch + "-unknown-linux-gnueabihf";
#  elif defined(__GLIBC__) || defined(__GNU_LIBRARY__)
    return arch + "-unknown-linux-gnu";
#  else
    return arch + "-unknown-linux-musl";
#  endif
#elif defined(__FreeBSD__)
    return arch + "-unknown-freebsd";
#else
    throw ResolveError(ErrorKind::ConfigInvalid, "unsupported host OS; pass a target triple explicitly");
#endif
}

std::string TargetPlatform::library_extension(const std::string& triple, LinkMode mode) {
    if (mode == LinkMode::Static) {
        return triple.find("windows-msvc") != std::string::npos ? ".lib" : ".a";
    }
    if (triple.find("apple") != std::string::npos) return ".dylib";
    if (triple.find("windows") != std::string::npos) return ".dll";
    return ".so";
}

} // namespace Prebuilt
