#pragma once

#include <filesystem>
#include <string>

namespace Prebuilt {

/**
 * @brief Directory scheme of the local release cache.
 *
 *   <root>/manifests/<build_id>/          manifest + .sig
 *   <root>/artifacts/<build_id>/          archives + .sig
 *   <root>/extracted/<build_id>/<triple>/ extracted libraries
 */
struct CacheLayout {
    std::filesystem::path root;

    std::filesystem::path manifest_dir(const std::string& build_id) const {
        return root / "manifests" / build_id;
    }

    std::filesystem::path artifact_dir(const std::string& build_id) const {
        return root / "artifacts" / build_id;
    }

    std::filesystem::path extraction_dir(const std::string& build_id, const std::string& target_triple) const {
        return root / "extracted" / build_id / target_triple;
    }
};

} // namespace Prebuilt
