#include <archive/archive_extractor.hpp>
#include <storage/file_io.hpp>
#include <core/errors.hpp>
#include <system_error>

namespace Prebuilt {

namespace fs = std::filesystem;

namespace {

std::string base_name(const std::string& entry_path) {
    size_t slash = entry_path.rfind('/');
    return slash == std::string::npos ? entry_path : entry_path.substr(slash + 1);
}

bool has_extension(const std::string& file_name, const std::string& extension) {
    return file_name.size() > extension.size() &&
           file_name.compare(file_name.size() - extension.size(), extension.size(), extension) == 0;
}

bool under_lib_directory(const std::string& entry_path) {
    size_t start = 0;
    size_t slash;
    while ((slash = entry_path.find('/', start)) != std::string::npos) {
        if (entry_path.compare(start, slash - start, "lib") == 0 && slash - start == 3) {
            return true;
        }
        start = slash + 1;
    }
    return false;
}

} // namespace

std::optional<size_t> ArchiveExtractor::select_entry(const std::vector<ArchiveEntry>& entries,
                                                     const std::string& expected_extension) {
    std::optional<size_t> fallback;
    for (size_t i = 0; i < entries.size(); ++i) {
        const ArchiveEntry& entry = entries[i];
        if (!entry.regular_file || !has_extension(base_name(entry.path), expected_extension)) continue;

        if (under_lib_directory(entry.path)) return i;
        if (!fallback) fallback = i;
    }
    return fallback;
}

std::optional<fs::path> ArchiveExtractor::find_existing(const std::string& expected_extension) const {
    std::error_code ec;
    if (!fs::is_directory(extraction_dir_, ec)) return std::nullopt;

    std::optional<fs::path> best;
    for (fs::directory_iterator it(extraction_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (name.empty() || name[0] == '.' || !has_extension(name, expected_extension)) continue;
        if (!it->is_regular_file(ec)) continue;
        if (!best || it->path() < *best) best = it->path();
    }
    if (ec) {
        throw ResolveError(ErrorKind::IoError, "cannot list " + extraction_dir_.string() + ": " + ec.message());
    }
    return best;
}

fs::path ArchiveExtractor::extract_library(const fs::path& archive, const std::string& expected_extension) {
    if (auto existing = find_existing(expected_extension)) {
        reporter_.debug("reusing extracted " + existing->string());
        return *existing;
    }

    auto reader = ArchiveReader::open(archive);
    const auto& entries = reader->entries();

    auto index = select_entry(entries, expected_extension);
    if (!index) {
        throw ResolveError(ErrorKind::LibraryNotFoundInArchive,
                           "no *" + expected_extension + " file in " + archive.filename().string());
    }

    const ArchiveEntry& entry = entries[*index];
    fs::path target = extraction_dir_ / base_name(entry.path);
    reporter_.step("Extracting " + entry.path);
    FileIO::write_atomic(target, reader->read(*index));
    return target;
}

} // namespace Prebuilt
