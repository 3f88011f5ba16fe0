/**
 * @file test_archive_extractor.cpp
 * @brief ZIP / tar.gz decoding and library selection
 */

#include <gtest/gtest.h>
#include <archive/archive_extractor.hpp>
#include <archive/archive_reader.hpp>
#include <archive/inflate.hpp>
#include <core/errors.hpp>
#include <storage/file_io.hpp>
#include "../support/archive_builder.hpp"
#include "../support/test_project.hpp"

using namespace Prebuilt;
using namespace Prebuilt::Testing;

namespace {

class ArchiveExtractorTest : public ::testing::Test {
protected:
    ArchiveExtractorTest() : reporter_(Reporter::silent()) {}

    std::filesystem::path write_archive(const std::string& name, const std::vector<uint8_t>& bytes) {
        std::filesystem::path path = project_.root() / "artifacts" / name;
        FileIO::write_atomic(path, bytes);
        return path;
    }

    std::filesystem::path out_dir() const { return project_.root() / "extracted"; }

    ErrorKind extract_error(const std::filesystem::path& archive, const std::string& ext) {
        ArchiveExtractor extractor(out_dir(), reporter_);
        try {
            extractor.extract_library(archive, ext);
        } catch (const ResolveError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "extracted from " << archive;
        return ErrorKind::IoError;
    }

    TestProject project_;
    Reporter reporter_;
};

} // namespace

TEST_F(ArchiveExtractorTest, TarGzPrefersLibDirectory) {
    auto archive = write_archive("demo.tar.gz", ArchiveBuilder::tar_gz({
        {"pkg/", ""},
        {"pkg/debug/libdemo.so", "debug build"},
        {"pkg/lib/libdemo.so", "release build"},
        {"pkg/README.md", "docs"},
    }));

    ArchiveExtractor extractor(out_dir(), reporter_);
    auto library = extractor.extract_library(archive, ".so");

    EXPECT_EQ(library, out_dir() / "libdemo.so");
    EXPECT_EQ(FileIO::read_text(library), "release build");
}

TEST_F(ArchiveExtractorTest, ZipFallsBackToFirstExtensionMatch) {
    for (bool compress : {true, false}) {
        TestProject scratch;
        auto archive = scratch.write("demo.zip", "");
        auto bytes = ArchiveBuilder::zip({
            {"include/demo.h", "header"},
            {"bin/demo.dll", std::string(4096, 'D')},
            {"other/extra.dll", "second"},
        }, compress);
        FileIO::write_atomic(archive, bytes);

        ArchiveExtractor extractor(scratch.root() / "out", reporter_);
        auto library = extractor.extract_library(archive, ".dll");
        EXPECT_EQ(library.filename(), "demo.dll");
        EXPECT_EQ(FileIO::read_text(library), std::string(4096, 'D'));
    }
}

TEST_F(ArchiveExtractorTest, LibraryNotFound) {
    auto archive = write_archive("demo.tgz", ArchiveBuilder::tar_gz({{"lib/libdemo.dylib", "mac"}}));
    EXPECT_EQ(extract_error(archive, ".so"), ErrorKind::LibraryNotFoundInArchive);
}

TEST_F(ArchiveExtractorTest, UnsupportedSuffix) {
    auto archive = write_archive("demo.tar.xz", {1, 2, 3});
    EXPECT_EQ(extract_error(archive, ".so"), ErrorKind::UnsupportedArchive);
    EXPECT_FALSE(ArchiveReader::is_supported(archive));
    EXPECT_TRUE(ArchiveReader::is_supported("x/Demo.TGZ"));
}

TEST_F(ArchiveExtractorTest, CorruptArchives) {
    auto zip = ArchiveBuilder::zip({{"lib/libdemo.so", "content"}}, false);
    // Flip a byte of stored data: CRC-32 must catch it.
    zip[30 + std::string("lib/libdemo.so").size()] ^= 0xFF;
    EXPECT_EQ(extract_error(write_archive("bad.zip", zip), ".so"), ErrorKind::ArchiveInvalid);

    auto tgz = ArchiveBuilder::tar_gz({{"lib/libdemo.so", "content"}});
    tgz.resize(tgz.size() / 2);
    EXPECT_EQ(extract_error(write_archive("truncated.tar.gz", tgz), ".so"), ErrorKind::ArchiveInvalid);

    EXPECT_EQ(extract_error(write_archive("garbage.zip", std::vector<uint8_t>(64, 7)), ".so"),
              ErrorKind::ArchiveInvalid);
}

TEST_F(ArchiveExtractorTest, ReusesExtractedLibrary) {
    auto archive = write_archive("demo.tar.gz", ArchiveBuilder::tar_gz({{"lib/libdemo.so", "v1"}}));

    ArchiveExtractor extractor(out_dir(), reporter_);
    auto first = extractor.extract_library(archive, ".so");

    // Archive gone: a second call must not need it.
    std::filesystem::remove(archive);
    auto second = extractor.extract_library(archive, ".so");

    EXPECT_EQ(first, second);
    EXPECT_EQ(FileIO::read_text(second), "v1");
}

TEST(ArchiveReaderTest, TarLongNamesUsePrefix) {
    TestProject project;
    std::string deep = "release/" + std::string(60, 'd') + "/" + std::string(50, 'e') + "/lib/libdemo.so";
    auto archive = project.write("long.tar.gz", "");
    FileIO::write_atomic(archive, ArchiveBuilder::tar_gz({{deep, "deep"}}));

    auto reader = ArchiveReader::open(archive);
    ASSERT_EQ(reader->entries().size(), 1u);
    EXPECT_EQ(reader->entries()[0].path, deep);
    EXPECT_TRUE(reader->entries()[0].regular_file);

    auto data = reader->read(0);
    EXPECT_EQ(std::string(data.begin(), data.end()), "deep");
}

TEST(ArchiveReaderTest, TarGnuLongNameRecord) {
    TestProject project;
    std::string deep = std::string(180, 'n') + "/lib/libdemo.so";
    auto archive = project.write("gnu.tar.gz", "");
    FileIO::write_atomic(archive, ArchiveBuilder::tar_gz_records({
        {"././@LongLink", deep + std::string(1, '\0'), 'L'},
        {"truncated-name", "gnu", '0'},
        {"short/libother.so", "next", '0'},
    }));

    auto reader = ArchiveReader::open(archive);
    ASSERT_EQ(reader->entries().size(), 2u);
    EXPECT_EQ(reader->entries()[0].path, deep);
    EXPECT_EQ(reader->entries()[1].path, "short/libother.so");

    auto data = reader->read(0);
    EXPECT_EQ(std::string(data.begin(), data.end()), "gnu");
}

TEST(ArchiveReaderTest, TarPaxPathRecord) {
    TestProject project;
    std::string deep = "pkg/" + std::string(200, 'p') + "/lib/libdemo.so";
    std::string pax = ArchiveBuilder::pax_record("mtime", "1700000000.5") + ArchiveBuilder::pax_record("path", deep);
    auto archive = project.write("pax.tar.gz", "");
    FileIO::write_atomic(archive, ArchiveBuilder::tar_gz_records({
        {"pax_global_header", ArchiveBuilder::pax_record("comment", "release"), 'g'},
        {"PaxHeaders/libdemo.so", pax, 'x'},
        {"libdemo.so", "pax", '0'},
    }));

    auto reader = ArchiveReader::open(archive);
    ASSERT_EQ(reader->entries().size(), 1u);
    EXPECT_EQ(reader->entries()[0].path, deep);

    auto data = reader->read(0);
    EXPECT_EQ(std::string(data.begin(), data.end()), "pax");
}

TEST(ArchiveReaderTest, TarBase256Size) {
    TestProject project;
    auto archive = project.write("base256.tar.gz", "");
    FileIO::write_atomic(archive, ArchiveBuilder::tar_gz_records({
        {"lib/libdemo.so", std::string(700, 'b'), '0', true},
        {"lib/README", "after", '0'},
    }));

    auto reader = ArchiveReader::open(archive);
    ASSERT_EQ(reader->entries().size(), 2u);
    EXPECT_EQ(reader->entries()[0].size, 700u);
    EXPECT_EQ(reader->read(0).size(), 700u);
    auto after = reader->read(1);
    EXPECT_EQ(std::string(after.begin(), after.end()), "after");
}

TEST_F(ArchiveExtractorTest, MalformedPaxRecordsAreArchiveInvalid) {
    std::vector<std::string> bad_headers = {
        "1 path=x\n",            // shorter than its own length prefix
        "2 \n",                  // length covers only the prefix
        "99 path=lib/libdemo.so\n",  // longer than the header data
        "18446744073709551616 path=x\n",
        "12path=x\n",
        "x1 path=y\n",
    };
    for (size_t i = 0; i < bad_headers.size(); ++i) {
        auto archive = write_archive("pax" + std::to_string(i) + ".tar.gz", ArchiveBuilder::tar_gz_records({
            {"PaxHeaders/libdemo.so", bad_headers[i], 'x'},
            {"lib/libdemo.so", "content", '0'},
        }));
        EXPECT_EQ(extract_error(archive, ".so"), ErrorKind::ArchiveInvalid) << bad_headers[i];
    }
}

TEST(ArchiveReaderTest, SelectionRules) {
    std::vector<ArchiveEntry> entries = {
        {"lib/", false, 0},
        {"libdemo.so", true, 1},
        {"target/lib/libdemo.so", true, 1},
        {"liberal/libdemo.so", true, 1},
    };
    EXPECT_EQ(ArchiveExtractor::select_entry(entries, ".so"), 2u);
    EXPECT_EQ(ArchiveExtractor::select_entry({entries[0], entries[1], entries[3]}, ".so"), 1u);
    EXPECT_FALSE(ArchiveExtractor::select_entry(entries, ".dll").has_value());
}

TEST(InflateTest, RejectsGarbage) {
    std::vector<uint8_t> garbage(32, 0xAB);
    EXPECT_THROW(Inflate::gunzip(garbage), ResolveError);
}

TEST(InflateTest, RejectsImpossibleExpansionRatio) {
    std::vector<uint8_t> tiny = {0x03, 0x00};  // empty final block
    try {
        Inflate::inflate_raw(tiny.data(), tiny.size(), size_t(1) << 30);
        FAIL() << "expected ArchiveInvalid";
    } catch (const ResolveError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ArchiveInvalid);
    }
}
