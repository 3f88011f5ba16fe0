#include <config/config_model.hpp>
#include <storage/file_io.hpp>
#include <core/errors.hpp>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <vector>

namespace Prebuilt {

namespace {

std::string trim(std::string_view raw) {
    size_t start = 0;
    size_t end = raw.size();
    while (start < end && std::isspace(static_cast<unsigned char>(raw[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(raw[end - 1]))) --end;
    return std::string(raw.substr(start, end - start));
}

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

[[noreturn]] void invalid(const std::string& message) {
    throw ResolveError(ErrorKind::ConfigInvalid, message);
}

std::string required_string(const YAML::Node& section, const char* key) {
    YAML::Node node = section[key];
    if (!node || node.IsNull()) {
        invalid(std::string(ConfigModel::SECTION) + "." + key + " is required");
    }
    if (!node.IsScalar()) {
        invalid(std::string(ConfigModel::SECTION) + "." + key + " must be a string");
    }
    return node.Scalar();
}

std::optional<std::string> optional_string(const YAML::Node& section, const char* key) {
    YAML::Node node = section[key];
    if (!node || node.IsNull()) return std::nullopt;
    if (!node.IsScalar()) {
        invalid(std::string(ConfigModel::SECTION) + "." + key + " must be a string");
    }
    return node.Scalar();
}

PrecompiledConfig parse_section(const YAML::Node& section) {
    if (!section.IsMap()) {
        invalid(std::string(ConfigModel::SECTION) + " must be a map");
    }

    static const std::vector<std::string> known = {"repository", "public_key", "url_prefix", "mode"};
    for (const auto& item : section) {
        std::string key = item.first.as<std::string>();
        if (std::find(known.begin(), known.end(), key) == known.end()) {
            invalid("unknown key " + std::string(ConfigModel::SECTION) + "." + key);
        }
    }

    PrecompiledConfig config;

    auto repository = normalize_repository(required_string(section, "repository"));
    if (!repository) {
        invalid(std::string(ConfigModel::SECTION) +
                ".repository must be in owner/repo format (or github.com/owner/repo)");
    }
    config.repository = *repository;

    auto key = SignatureVerifier::parse_public_key_hex(required_string(section, "public_key"));
    if (!key) {
        invalid(std::string(ConfigModel::SECTION) + ".public_key must be 32 bytes of hex");
    }
    config.public_key = *key;

    config.url_prefix = optional_string(section, "url_prefix");

    if (auto raw_mode = optional_string(section, "mode")) {
        auto mode = parse_mode(*raw_mode);
        if (!mode) {
            invalid(std::string(ConfigModel::SECTION) +
                    ".mode must be one of: auto, always, never (aliases: download->always, build|off|disabled->never)");
        }
        config.mode = *mode;
    }

    return config;
}

} // namespace

const char* to_string(PrecompiledMode mode) {
    switch (mode) {
        case PrecompiledMode::Auto:   return "auto";
        case PrecompiledMode::Always: return "always";
        case PrecompiledMode::Never:  return "never";
    }
    return "auto";
}

std::optional<PrecompiledMode> parse_mode(std::string_view raw) {
    std::string v = lower(trim(raw));
    if (v == "auto") return PrecompiledMode::Auto;
    if (v == "always" || v == "download") return PrecompiledMode::Always;
    if (v == "never" || v == "build" || v == "off" || v == "disabled") return PrecompiledMode::Never;
    return std::nullopt;
}

std::optional<std::string> normalize_repository(std::string_view raw) {
    std::string v = trim(raw);
    if (starts_with(v, "https://")) v = v.substr(8);
    else if (starts_with(v, "http://")) v = v.substr(7);
    if (starts_with(v, "github.com/")) v = v.substr(11);
    while (!v.empty() && v.back() == '/') v.pop_back();

    size_t slash = v.find('/');
    if (slash == std::string::npos) return std::nullopt;
    std::string owner = v.substr(0, slash);
    std::string repo = v.substr(slash + 1);
    if (owner.empty() || repo.empty() || repo.find('/') != std::string::npos) {
        return std::nullopt;
    }
    return owner + "/" + repo;
}

std::string PrecompiledConfig::file_url(const std::string& build_id, const std::string& file_name) const {
    if (url_prefix && !url_prefix->empty()) {
        return *url_prefix + build_id + "/" + file_name;
    }
    return std::string("https://") + ConfigModel::DEFAULT_HOST + "/" + repository +
           "/releases/download/" + build_id + "/" + file_name;
}

std::optional<PrecompiledConfig> ConfigModel::load(const std::filesystem::path& project_dir) {
    std::filesystem::path path = project_dir / CONFIG_FILE;
    if (!FileIO::is_regular_file(path)) {
        return std::nullopt;
    }
    try {
        return parse(FileIO::read_text(path));
    } catch (const ResolveError& e) {
        if (e.kind() != ErrorKind::ConfigInvalid) throw;
        throw ResolveError(ErrorKind::ConfigInvalid, path.string() + ": " + e.what());
    }
}

std::optional<PrecompiledConfig> ConfigModel::parse(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        invalid(std::string("cannot parse YAML: ") + e.what());
    }

    if (!root.IsMap()) {
        invalid(std::string(CONFIG_FILE) + " must be a map");
    }

    // Only an absent key means "no config"; an empty section is malformed.
    YAML::Node section = root[SECTION];
    if (!section) {
        return std::nullopt;
    }

    try {
        return parse_section(section);
    } catch (const YAML::Exception& e) {
        invalid(std::string("malformed ") + SECTION + ": " + e.what());
    }
}

} // namespace Prebuilt
