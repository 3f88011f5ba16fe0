/**
 * @file build_identity.cpp
 * @brief Build identity hashing implementation
 */

#include <hashing/build_identity.hpp>
#include <hashing/sha256_pipeline.hpp>
#include <storage/file_io.hpp>
#include <core/errors.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>

namespace Prebuilt {

namespace fs = std::filesystem;

namespace {

// Field names are shared with every other consumer of the release protocol.
constexpr const char* FIELD_LOCK = "cargo.lock";
constexpr const char* FIELD_DESCRIPTOR = "cargo.toml";
constexpr const char* FIELD_TARGET = "rust.target_triple";
constexpr const char* FIELD_INTERFACE = "uniffi.udl";
constexpr const char* FIELD_CONFIG = "xforge.yaml";

fs::path normalized_dir(const fs::path& dir) {
    std::error_code ec;
    fs::path abs = fs::absolute(dir, ec);
    if (ec) abs = dir;
    abs = abs.lexically_normal();
    if (abs.has_parent_path() && abs.filename().empty()) {
        abs = abs.parent_path();
    }
    return abs;
}

std::string read_required(const fs::path& path, const std::string& what) {
    if (!FileIO::is_regular_file(path)) {
        throw ResolveError(ErrorKind::InputMissing, "missing required file " + what + " (" + path.string() + ")");
    }
    return FileIO::read_text(path);
}

std::optional<std::string> read_optional(const fs::path& path) {
    if (!FileIO::is_regular_file(path)) return std::nullopt;
    return FileIO::read_text(path);
}

} // namespace

std::optional<fs::path> BuildIdentityHasher::find_lock_file(const fs::path& start_dir) {
    fs::path current = normalized_dir(start_dir);
    while (true) {
        fs::path candidate = current / LOCK_FILE;
        if (FileIO::is_regular_file(candidate)) {
            return candidate;
        }
        fs::path parent = current.parent_path();
        if (parent.empty() || parent == current) {
            return std::nullopt;
        }
        current = parent;
    }
}

std::vector<BuildInput> BuildIdentityHasher::collect_inputs(
    const fs::path& project_dir,
    const std::optional<fs::path>& interface_definition) {

    std::string descriptor = read_required(project_dir / DESCRIPTOR_FILE, DESCRIPTOR_FILE);

    auto lock_path = find_lock_file(project_dir);
    if (!lock_path) {
        throw ResolveError(ErrorKind::InputMissing,
                           std::string("missing required file ") + LOCK_FILE +
                           " (searched from " + normalized_dir(project_dir).string() + " to the filesystem root)");
    }
    std::string lock = FileIO::read_text(*lock_path);

    std::optional<std::string> config = read_optional(project_dir / CONFIG_FILE);

    std::optional<std::string> interface;
    if (interface_definition) {
        interface = read_required(*interface_definition, "interface definition");
    }

    // The target triple is always recorded absent: one identity per release,
    // shared by every target it covers.
    return {
        {FIELD_DESCRIPTOR, true, descriptor},
        {FIELD_LOCK, true, lock},
        {FIELD_TARGET, true, std::nullopt},
        {FIELD_INTERFACE, true, interface},
        {FIELD_CONFIG, true, config},
    };
}

std::string BuildIdentityHasher::canonical_json(std::vector<BuildInput> inputs) {
    std::sort(inputs.begin(), inputs.end(),
              [](const BuildInput& a, const BuildInput& b) { return a.name < b.name; });

    // nlohmann::json objects are std::map backed, so keys come out sorted.
    nlohmann::json fields = nlohmann::json::array();
    for (const auto& input : inputs) {
        nlohmann::json field;
        field["affects_abi"] = input.affects_abi;
        field["name"] = input.name;
        field["value"] = input.content ? nlohmann::json(*input.content) : nlohmann::json(nullptr);
        fields.push_back(std::move(field));
    }

    nlohmann::json root;
    root["inputs"] = std::move(fields);
    root["version"] = HASH_VERSION;

    try {
        return root.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const nlohmann::json::type_error& e) {
        throw ResolveError(ErrorKind::InputInvalid, std::string("build input is not valid UTF-8: ") + e.what());
    }
}

std::string BuildIdentityHasher::hash_inputs(const std::vector<BuildInput>& inputs) {
    std::string canonical = canonical_json(inputs);
    auto digest = SHA256Pipeline::hash(canonical);
    return std::string(HASH_VERSION) + "-" + SHA256Pipeline::to_hex(digest);
}

std::string BuildIdentityHasher::compute_build_id(
    const fs::path& project_dir,
    const std::optional<fs::path>& interface_definition) {
    return hash_inputs(collect_inputs(project_dir, interface_definition));
}

bool BuildIdentityHasher::is_valid_build_id(const std::string& build_id) {
    if (build_id.empty() || build_id.size() > 200 || build_id.front() == '.') return false;
    return std::all_of(build_id.begin(), build_id.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
               c == '.' || c == '_' || c == '-';
    });
}

} // namespace Prebuilt
