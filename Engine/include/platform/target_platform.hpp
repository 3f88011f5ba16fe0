#pragma once

#include <export.hpp>
#include <string>

namespace Prebuilt {

enum class LinkMode {
    Dynamic,
    Static
};

/**
 * @brief Rust target triples and their library file conventions.
 */
class PREBUILT_API TargetPlatform {
public:
    /**
     * @brief Triple of the platform this binary was compiled for.
     * @throws ResolveError ConfigInvalid on an unrecognized OS/arch
     */
    static std::string detect_host_triple();

    /**
     * @brief Dynamic: ".dylib" for Apple triples, ".dll" for Windows, else ".so".
     *        Static: ".lib" for MSVC triples, else ".a".
     */
    static std::string library_extension(const std::string& triple, LinkMode mode = LinkMode::Dynamic);
};

} // namespace Prebuilt
