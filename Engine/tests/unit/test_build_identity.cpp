/**
 * @file test_build_identity.cpp
 * @brief SHA-256 digests and build identity vectors
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <hashing/build_identity.hpp>
#include <hashing/sha256_pipeline.hpp>
#include <functional>
#include "../support/test_project.hpp"

using namespace Prebuilt;
using namespace Prebuilt::Testing;

namespace {

constexpr const char* GOLDEN_ID = "b1-c4fef3d0bf86f8a60dc70d590a31e71c1cbb87f23256b6270add444c1f0ae345";
constexpr const char* GOLDEN_ID_WITH_CONFIG = "b1-5f8b7114fef3e31eb5ef567c7e93b8591ccb33f45ec64741e9d6908383d66ecd";
constexpr const char* GOLDEN_CONFIG = "precompiled_binaries:\n  repository: acme/widgets\n";

ErrorKind kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const ResolveError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected ResolveError";
    return ErrorKind::IoError;
}

} // namespace

TEST(SHA256PipelineTest, KnownAnswers) {
    EXPECT_EQ(SHA256Pipeline::to_hex(SHA256Pipeline::hash(std::string_view("abc"))),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(SHA256Pipeline::to_hex(SHA256Pipeline::hash(std::string_view(""))),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256PipelineTest, FileMatchesBuffer) {
    TestProject project;
    std::string content(100000, 'x');
    auto path = project.write("blob.bin", content);

    EXPECT_EQ(SHA256Pipeline::hash_file(path), SHA256Pipeline::hash(std::string_view(content)));
}

TEST(SHA256PipelineTest, MissingFileIsIoError) {
    TestProject project;
    EXPECT_EQ(kind_of([&] { SHA256Pipeline::hash_file(project.root() / "nope"); }), ErrorKind::IoError);
}

TEST(BuildIdentityTest, CanonicalJsonGolden) {
    TestProject project;
    project.write_sample_crate();

    auto inputs = BuildIdentityHasher::collect_inputs(project.root());
    EXPECT_EQ(BuildIdentityHasher::canonical_json(inputs),
              "{\"inputs\":["
              "{\"affects_abi\":true,\"name\":\"cargo.lock\",\"value\":\"version = 3\\n[[package]]\\nname = \\\"demo\\\"\\nversion = \\\"0.1.0\\\"\\n\"},"
              "{\"affects_abi\":true,\"name\":\"cargo.toml\",\"value\":\"[package]\\nname = \\\"demo\\\"\\nversion = \\\"0.1.0\\\"\\n\"},"
              "{\"affects_abi\":true,\"name\":\"rust.target_triple\",\"value\":null},"
              "{\"affects_abi\":true,\"name\":\"uniffi.udl\",\"value\":null},"
              "{\"affects_abi\":true,\"name\":\"xforge.yaml\",\"value\":null}"
              "],\"version\":\"b1\"}");
}

TEST(BuildIdentityTest, GoldenBuildId) {
    TestProject project;
    project.write_sample_crate();
    EXPECT_EQ(BuildIdentityHasher::compute_build_id(project.root()), GOLDEN_ID);

    project.write("xforge.yaml", GOLDEN_CONFIG);
    EXPECT_EQ(BuildIdentityHasher::compute_build_id(project.root()), GOLDEN_ID_WITH_CONFIG);
}

TEST(BuildIdentityTest, InputOrderDoesNotMatter) {
    std::vector<BuildInput> a = {{"b", true, std::string("2")}, {"a", true, std::nullopt}};
    std::vector<BuildInput> b = {{"a", true, std::nullopt}, {"b", true, std::string("2")}};
    EXPECT_EQ(BuildIdentityHasher::hash_inputs(a), BuildIdentityHasher::hash_inputs(b));
}

TEST(BuildIdentityTest, SensitiveToLockBytes) {
    TestProject project;
    project.write_sample_crate();
    std::string before = BuildIdentityHasher::compute_build_id(project.root());

    std::string lock = SAMPLE_CARGO_LOCK;
    lock[lock.size() - 3] = '1';
    project.write("Cargo.lock", lock);

    EXPECT_NE(BuildIdentityHasher::compute_build_id(project.root()), before);
}

TEST(BuildIdentityTest, SensitiveToConfigPresence) {
    TestProject project;
    project.write_sample_crate();
    std::string without = BuildIdentityHasher::compute_build_id(project.root());

    project.write("xforge.yaml", "");
    std::string empty = BuildIdentityHasher::compute_build_id(project.root());

    EXPECT_NE(without, empty);
}

TEST(BuildIdentityTest, InterfaceDefinitionIsHashed) {
    TestProject project;
    project.write_sample_crate();
    auto udl = project.write("src/api.udl", "namespace demo {};\n");

    EXPECT_NE(BuildIdentityHasher::compute_build_id(project.root(), udl),
              BuildIdentityHasher::compute_build_id(project.root()));
    EXPECT_EQ(kind_of([&] { BuildIdentityHasher::compute_build_id(project.root(), project.root() / "missing.udl"); }),
              ErrorKind::InputMissing);
}

TEST(BuildIdentityTest, LockFoundInWorkspaceRoot) {
    TestProject project;
    project.write("Cargo.lock", SAMPLE_CARGO_LOCK);
    project.write("crates/demo/Cargo.toml", SAMPLE_CARGO_TOML);

    auto lock = BuildIdentityHasher::find_lock_file(project.root() / "crates" / "demo");
    ASSERT_TRUE(lock.has_value());
    EXPECT_TRUE(std::filesystem::equivalent(*lock, project.root() / "Cargo.lock"));

    // Same bytes, same identity, wherever the lock lives.
    EXPECT_EQ(BuildIdentityHasher::compute_build_id(project.root() / "crates" / "demo"), GOLDEN_ID);
}

TEST(BuildIdentityTest, MissingDescriptorIsInputMissing) {
    TestProject project;
    project.write("Cargo.lock", SAMPLE_CARGO_LOCK);
    EXPECT_EQ(kind_of([&] { BuildIdentityHasher::compute_build_id(project.root()); }), ErrorKind::InputMissing);
}

TEST(BuildIdentityTest, BuildIdValidation) {
    EXPECT_TRUE(BuildIdentityHasher::is_valid_build_id(GOLDEN_ID));
    EXPECT_TRUE(BuildIdentityHasher::is_valid_build_id("v1.2.3_rc-1"));
    EXPECT_FALSE(BuildIdentityHasher::is_valid_build_id(""));
    EXPECT_FALSE(BuildIdentityHasher::is_valid_build_id("../etc"));
    EXPECT_FALSE(BuildIdentityHasher::is_valid_build_id("a/b"));
    EXPECT_FALSE(BuildIdentityHasher::is_valid_build_id(".hidden"));
    EXPECT_FALSE(BuildIdentityHasher::is_valid_build_id(std::string(201, 'a')));
}
