/**
 * @file build_identity.hpp
 * @brief Deterministic build identity for a source checkout
 *
 * A BuildId names one release: every consumer hashing the same inputs must
 * arrive at the same string, so the input set, serialization and digest are
 * part of the distribution protocol.
 */

#pragma once

#include <export.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Prebuilt {

/**
 * @brief One named, ABI-affecting input. Absent inputs are hashed as null.
 */
struct BuildInput {
    std::string name;
    bool affects_abi = true;
    std::optional<std::string> content;
};

class PREBUILT_API BuildIdentityHasher {
public:
    static constexpr const char* HASH_VERSION = "b1";

    static constexpr const char* DESCRIPTOR_FILE = "Cargo.toml";
    static constexpr const char* LOCK_FILE = "Cargo.lock";
    static constexpr const char* CONFIG_FILE = "xforge.yaml";

    /**
     * @brief Compute "<version>-<sha256 hex>" for a project directory.
     *
     * @param project_dir Directory holding the project descriptor
     * @param interface_definition Optional interface-definition file to hash
     * @throws ResolveError InputMissing when the descriptor, the lock file
     *         (searched up to the filesystem root) or a given interface file
     *         is missing; InputInvalid when an input is not valid UTF-8
     */
    static std::string compute_build_id(
        const std::filesystem::path& project_dir,
        const std::optional<std::filesystem::path>& interface_definition = std::nullopt);

    /**
     * @brief Collect the fixed input list in its unsorted, declared order.
     */
    static std::vector<BuildInput> collect_inputs(
        const std::filesystem::path& project_dir,
        const std::optional<std::filesystem::path>& interface_definition = std::nullopt);

    /**
     * @brief Canonical serialization: inputs sorted by name, keys sorted,
     *        compact separators, null for absent values.
     */
    static std::string canonical_json(std::vector<BuildInput> inputs);

    static std::string hash_inputs(const std::vector<BuildInput>& inputs);

    /**
     * @brief Walk from start_dir towards the root looking for the lock file.
     */
    static std::optional<std::filesystem::path> find_lock_file(const std::filesystem::path& start_dir);

    /**
     * @brief A BuildId is used as a path component and a URL segment, so only
     *        [A-Za-z0-9._-] is accepted, with no leading dot.
     */
    static bool is_valid_build_id(const std::string& build_id);
};

} // namespace Prebuilt
