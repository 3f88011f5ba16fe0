/**
 * @file test_command_line.cpp
 * @brief prebuilt subcommands and their exit codes
 */

#include <gtest/gtest.h>
#include <cli/command_line.hpp>
#include <hashing/build_identity.hpp>
#include <release/manifest.hpp>
#include <storage/file_io.hpp>
#include "../support/archive_builder.hpp"
#include "../support/release_fixture.hpp"
#include "../support/test_project.hpp"
#include <sstream>

using namespace Prebuilt;
using namespace Prebuilt::Testing;

namespace {

constexpr const char* TRIPLE = "x86_64-unknown-linux-gnu";
constexpr const char* ARTIFACT = "demo-x86_64-unknown-linux-gnu.tar.gz";

class CommandLineTest : public ::testing::Test {
protected:
    CommandLineTest() { project_.write_sample_crate(); }

    int run(std::vector<std::string> args) {
        out_.str("");
        err_.str("");
        CommandLine cli(out_, err_);
        cli.set_http_client(release_.http);
        return cli.run(args);
    }

    std::vector<std::string> validate_args() const {
        return {"validate-precompiled", "--crate-dir", project_.root().string(), "--target", TRIPLE};
    }

    std::string publish_release() {
        project_.write("xforge.yaml", release_.config_yaml("auto"));
        std::string build_id = BuildIdentityHasher::compute_build_id(project_.root());
        release_.publish(build_id, Manifest::FILE_NAME, ReleaseFixture::manifest_json(build_id, TRIPLE, ARTIFACT));
        release_.publish(build_id, ARTIFACT, ArchiveBuilder::tar_gz({{"lib/libdemo.so", "ELF"}}));
        return build_id;
    }

    TestProject project_;
    ReleaseFixture release_;
    std::ostringstream out_;
    std::ostringstream err_;
};

} // namespace

TEST_F(CommandLineTest, UsageErrors) {
    EXPECT_EQ(run({}), CommandLine::EXIT_USAGE);
    EXPECT_EQ(run({"frobnicate"}), CommandLine::EXIT_USAGE);
    EXPECT_NE(err_.str().find("unknown command"), std::string::npos);

    auto args = validate_args();
    args.push_back("--bogus");
    EXPECT_EQ(run(args), CommandLine::EXIT_USAGE);

    EXPECT_EQ(run({"keygen", "extra"}), CommandLine::EXIT_USAGE);
    EXPECT_EQ(run({"--help"}), CommandLine::EXIT_OK);
    EXPECT_EQ(release_.http.total_requests(), 0);
}

TEST_F(CommandLineTest, ValidateSucceedsAgainstSignedRelease) {
    std::string build_id = publish_release();

    EXPECT_EQ(run(validate_args()), CommandLine::EXIT_OK) << err_.str();
    EXPECT_NE(out_.str().find("buildId: " + build_id), std::string::npos) << out_.str();
    EXPECT_NE(out_.str().find(std::string("artifact: ") + ARTIFACT), std::string::npos);
}

TEST_F(CommandLineTest, ValidateMissingConfigIsUsageError) {
    EXPECT_EQ(run(validate_args()), CommandLine::EXIT_USAGE);
    EXPECT_EQ(release_.http.total_requests(), 0);

    project_.write("xforge.yaml", "precompiled_binaries:\n  repository: acme\n");
    EXPECT_EQ(run(validate_args()), CommandLine::EXIT_USAGE);
    EXPECT_EQ(release_.http.total_requests(), 0);
}

TEST_F(CommandLineTest, ValidateInvalidBuildIdIsUsageError) {
    project_.write("xforge.yaml", release_.config_yaml());
    auto args = validate_args();
    args.insert(args.end(), {"--build-id", "../../etc"});

    EXPECT_EQ(run(args), CommandLine::EXIT_USAGE);
    EXPECT_NE(err_.str().find("not a valid build id"), std::string::npos) << err_.str();
    EXPECT_EQ(release_.http.total_requests(), 0);
}

TEST_F(CommandLineTest, ValidateInvalidLinkModeIsUsageError) {
    project_.write("xforge.yaml", release_.config_yaml());
    auto args = validate_args();
    args.push_back("--link-mode=both");
    EXPECT_EQ(run(args), CommandLine::EXIT_USAGE);
}

TEST_F(CommandLineTest, ValidateMissingReleaseFails) {
    project_.write("xforge.yaml", release_.config_yaml("never"));
    auto args = validate_args();
    args.push_back("--verbose");

    // validate-precompiled forces mode=always, whatever the config says.
    EXPECT_EQ(run(args), CommandLine::EXIT_FAILED);
    EXPECT_NE(err_.str().find("Validation failed (fatal)"), std::string::npos) << err_.str();
    EXPECT_NE(out_.str().find("Configured mode: never"), std::string::npos) << out_.str();
}

TEST_F(CommandLineTest, BuildIdMatchesHasher) {
    EXPECT_EQ(run({"build-id", "--crate-dir", project_.root().string()}), CommandLine::EXIT_OK);
    EXPECT_EQ(out_.str(), BuildIdentityHasher::compute_build_id(project_.root()) + "\n");

    std::filesystem::remove(project_.root() / "Cargo.toml");
    EXPECT_EQ(run({"build-id", "--crate-dir", project_.root().string()}), CommandLine::EXIT_FAILED);
}

TEST_F(CommandLineTest, SignThenVerify) {
    ASSERT_EQ(run({"keygen"}), CommandLine::EXIT_OK);
    std::istringstream keys(out_.str());
    std::string public_line;
    std::string private_line;
    std::getline(keys, public_line);
    std::getline(keys, private_line);
    ASSERT_EQ(public_line.rfind("public_key=", 0), 0u);
    ASSERT_EQ(private_line.rfind("private_key=", 0), 0u);
    std::string public_key = public_line.substr(11);
    std::string private_key = private_line.substr(12);
    EXPECT_EQ(public_key.size(), 64u);
    EXPECT_EQ(private_key.size(), 128u);

    auto file = project_.write("artifact.tar.gz", "payload");
    ASSERT_EQ(run({"sign", "--file", file.string(), "--private-key", private_key}), CommandLine::EXIT_OK);
    auto signature = std::filesystem::path(file.string() + ".sig");
    EXPECT_EQ(FileIO::read_bytes(signature).size(), 64u);
    EXPECT_NE(out_.str().find("sha256: 239f59ed55e737c77147cf55ad0c1b030b6d7ee748a7426952f9b852d5a935e5"),
              std::string::npos)
        << out_.str();

    std::vector<std::string> verify = {"verify", "--file", file.string(), "--signature", signature.string(),
                                       "--public-key", public_key};
    EXPECT_EQ(run(verify), CommandLine::EXIT_OK);

    project_.write("artifact.tar.gz", "tampered");
    EXPECT_EQ(run(verify), CommandLine::EXIT_FAILED);
    EXPECT_NE(out_.str().find("Signature INVALID"), std::string::npos);

    EXPECT_EQ(run({"sign", "--file", file.string(), "--private-key", "abcd"}), CommandLine::EXIT_USAGE);
}
