#include <resolve/toolchain_probe.hpp>
#include <cstdlib>
#include <string>
#include <system_error>
#include <vector>

namespace Prebuilt {

namespace fs = std::filesystem;

namespace {

#ifdef _WIN32
constexpr char PATH_SEPARATOR = ';';
constexpr const char* RUSTUP = "rustup.exe";
constexpr const char* HOME_VAR = "USERPROFILE";
#else
constexpr char PATH_SEPARATOR = ':';
constexpr const char* RUSTUP = "rustup";
constexpr const char* HOME_VAR = "HOME";
#endif

std::vector<fs::path> candidate_dirs() {
    std::vector<fs::path> dirs;

    if (const char* cargo_home = std::getenv("CARGO_HOME"); cargo_home && *cargo_home) {
        dirs.push_back(fs::path(cargo_home) / "bin");
    }
    if (const char* home = std::getenv(HOME_VAR); home && *home) {
        dirs.push_back(fs::path(home) / ".cargo" / "bin");
    }
    if (const char* path = std::getenv("PATH"); path && *path) {
        std::string value(path);
        size_t start = 0;
        while (start <= value.size()) {
            size_t end = value.find(PATH_SEPARATOR, start);
            if (end == std::string::npos) end = value.size();
            if (end > start) dirs.emplace_back(value.substr(start, end - start));
            start = end + 1;
        }
    }
    return dirs;
}

} // namespace

std::optional<fs::path> RustupProbe::locate() const {
    for (const auto& dir : candidate_dirs()) {
        fs::path candidate = dir / RUSTUP;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

} // namespace Prebuilt
