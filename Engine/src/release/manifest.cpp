#include <release/manifest.hpp>
#include <core/errors.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>

namespace Prebuilt {

using json = nlohmann::ordered_json;

namespace {

[[noreturn]] void invalid(const std::string& message) {
    throw ResolveError(ErrorKind::ManifestInvalid, "manifest: " + message);
}

std::string trim(const std::string& raw) {
    size_t start = 0;
    size_t end = raw.size();
    while (start < end && std::isspace(static_cast<unsigned char>(raw[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(raw[end - 1]))) --end;
    return raw.substr(start, end - start);
}

std::vector<std::string> string_list(const json& entry, const char* key, const std::string& where) {
    std::vector<std::string> out;
    auto it = entry.find(key);
    if (it == entry.end() || it->is_null()) return out;
    if (!it->is_array()) {
        invalid(where + "." + key + " must be a list of strings");
    }
    for (const auto& item : *it) {
        if (!item.is_string()) {
            invalid(where + "." + key + " must be a list of strings");
        }
        std::string value = trim(item.get<std::string>());
        if (!value.empty()) out.push_back(std::move(value));
    }
    return out;
}

PlatformEntry parse_entry(const json& entry, const std::string& where, const std::string* default_name) {
    if (!entry.is_object()) {
        invalid(where + " must be an object");
    }

    PlatformEntry platform;
    auto name = entry.find("name");
    if (name != entry.end() && !name->is_null()) {
        if (!name->is_string()) invalid(where + ".name must be a string");
        platform.name = trim(name->get<std::string>());
    } else if (default_name) {
        platform.name = trim(*default_name);
    }
    if (platform.name.empty()) {
        invalid(where + ".name must be a non-empty string");
    }

    platform.triples = string_list(entry, "triples", where);
    platform.artifacts = string_list(entry, "artifacts", where);
    return platform;
}

std::vector<PlatformEntry> parse_list(const json& list, const std::string& where) {
    std::vector<PlatformEntry> platforms;
    for (size_t i = 0; i < list.size(); ++i) {
        platforms.push_back(parse_entry(list[i], where + "[" + std::to_string(i) + "]", nullptr));
    }
    return platforms;
}

} // namespace

bool PlatformEntry::matches(const std::string& target_triple) const {
    return name == target_triple ||
           std::find(triples.begin(), triples.end(), target_triple) != triples.end();
}

Manifest Manifest::parse(std::string_view json_text) {
    json root;
    try {
        root = json::parse(json_text.begin(), json_text.end());
    } catch (const json::parse_error& e) {
        invalid(std::string("not valid JSON: ") + e.what());
    }
    if (!root.is_object()) {
        invalid("top level must be an object");
    }

    Manifest manifest;

    auto build = root.find("build");
    if (build != root.end() && !build->is_null()) {
        if (!build->is_object()) invalid("build must be an object");
        auto id = build->find("id");
        if (id != build->end() && !id->is_null()) {
            if (!id->is_string()) invalid("build.id must be a string");
            manifest.build_id = id->get<std::string>();
        }
    }

    auto platforms = root.find("platforms");
    if (platforms == root.end() || platforms->is_null()) {
        invalid("platforms is required");
    }

    if (platforms->is_array()) {
        manifest.platforms = parse_list(*platforms, "platforms");
    } else if (platforms->is_object()) {
        auto targets = platforms->find("targets");
        if (targets != platforms->end() && targets->is_array()) {
            manifest.platforms = parse_list(*targets, "platforms.targets");
        } else {
            for (auto it = platforms->begin(); it != platforms->end(); ++it) {
                manifest.platforms.push_back(parse_entry(it.value(), "platforms." + it.key(), &it.key()));
            }
        }
    } else {
        invalid("platforms must be a list or an object");
    }

    return manifest;
}

} // namespace Prebuilt
