#include <cli/command_line.hpp>
#include <config/config_model.hpp>
#include <config/resolver_options.hpp>
#include <core/errors.hpp>
#include <crypto/signature_verifier.hpp>
#include <hashing/build_identity.hpp>
#include <hashing/sha256_pipeline.hpp>
#include <net/curl_http_client.hpp>
#include <platform/target_platform.hpp>
#include <resolve/fallback_policy.hpp>
#include <resolve/toolchain_probe.hpp>
#include <storage/file_io.hpp>
#include <utils/hex.hpp>
#include <utils/logger.hpp>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>

namespace Prebuilt {

namespace fs = std::filesystem;

namespace {

class UsageError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

using Flags = std::map<std::string, std::string>;

// Accepts "--flag value" and "--flag=value" for valued flags, and bare
// switches, which are stored with the value "1".
Flags parse_flags(const std::vector<std::string>& args,
                  const std::vector<std::string>& valued,
                  const std::vector<std::string>& switches = {}) {
    auto contains = [](const std::vector<std::string>& names, const std::string& name) {
        for (const auto& n : names) {
            if (n == name) return true;
        }
        return false;
    };

    Flags values;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            values["--help"] = "1";
            continue;
        }
        if (contains(switches, arg)) {
            values[arg] = "1";
            continue;
        }

        std::string name = arg;
        std::string value;
        bool inline_value = false;
        size_t eq = arg.find('=');
        if (arg.compare(0, 2, "--") == 0 && eq != std::string::npos) {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
            inline_value = true;
        }

        if (!contains(valued, name)) {
            throw UsageError("unknown argument: " + arg);
        }
        if (!inline_value) {
            if (i + 1 >= args.size()) throw UsageError("missing value for " + name);
            value = args[++i];
        }
        values[name] = value;
    }
    return values;
}

std::string required(const Flags& flags, const std::string& name) {
    auto it = flags.find(name);
    if (it == flags.end() || it->second.empty()) {
        throw UsageError(name + " is required");
    }
    return it->second;
}

fs::path crate_dir(const Flags& flags) {
    auto it = flags.find("--crate-dir");
    return it == flags.end() ? fs::current_path() : fs::path(it->second);
}

LinkMode link_mode(const Flags& flags) {
    auto it = flags.find("--link-mode");
    if (it == flags.end() || it->second == "dynamic") return LinkMode::Dynamic;
    if (it->second == "static") return LinkMode::Static;
    throw UsageError("--link-mode must be dynamic or static");
}

} // namespace

void CommandLine::print_usage(std::ostream& stream) const {
    stream << "Usage: prebuilt <command> [options]\n"
           << "Commands:\n"
           << "  validate-precompiled [--crate-dir <path>] [--build-id <id>] [--target <triple>]\n"
           << "                       [--link-mode dynamic|static] [--verbose]\n"
           << "      Download, verify and extract the release for a crate (mode=always)\n"
           << "  build-id [--crate-dir <path>]\n"
           << "      Print the build id of a crate\n"
           << "  keygen\n"
           << "      Generate an Ed25519 key pair\n"
           << "  sign --file <path> --private-key <hex> [--out <path>]\n"
           << "      Write a detached signature (default <file>.sig)\n"
           << "  verify --file <path> --signature <path> --public-key <hex>\n"
           << "      Check a detached signature\n";
}

int CommandLine::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        print_usage(err_);
        return EXIT_USAGE;
    }

    const std::string& command = args.front();
    std::vector<std::string> rest(args.begin() + 1, args.end());

    try {
        if (command == "validate-precompiled") return validate_precompiled(rest);
        if (command == "build-id") return build_id(rest);
        if (command == "keygen") return keygen(rest);
        if (command == "sign") return sign(rest);
        if (command == "verify") return verify(rest);
        if (command == "--help" || command == "-h") {
            print_usage(out_);
            return EXIT_OK;
        }
        throw UsageError("unknown command: " + command);
    } catch (const UsageError& e) {
        err_ << "Argument error: " << e.what() << "\n";
        print_usage(err_);
        return EXIT_USAGE;
    } catch (const ResolveError& e) {
        err_ << to_string(e.kind()) << ": " << e.what() << "\n";
        return e.kind() == ErrorKind::ConfigInvalid ? EXIT_USAGE : EXIT_FAILED;
    } catch (const std::exception& e) {
        err_ << "Error: " << e.what() << "\n";
        return EXIT_FAILED;
    }
}

// ============================================================================
// validate-precompiled
// ============================================================================

int CommandLine::validate_precompiled(const std::vector<std::string>& args) {
    auto flags = parse_flags(args, {"--crate-dir", "--build-id", "--target", "--link-mode"}, {"--verbose"});
    if (flags.count("--help")) {
        print_usage(out_);
        return EXIT_OK;
    }

    fs::path dir = crate_dir(flags);
    ResolveRequest request;
    request.project_dir = dir;
    request.mode_override = PrecompiledMode::Always;
    request.link_mode = link_mode(flags);
    if (flags.count("--target")) request.target_triple = flags["--target"];
    if (flags.count("--build-id")) {
        if (!BuildIdentityHasher::is_valid_build_id(flags["--build-id"])) {
            throw UsageError("--build-id \"" + flags["--build-id"] + "\" is not a valid build id");
        }
        request.build_id = flags["--build-id"];
    }

    std::optional<PrecompiledConfig> config;
    try {
        config = ConfigModel::load(dir);
    } catch (const ResolveError& e) {
        err_ << "Config error: " << e.what() << "\n";
        return EXIT_USAGE;
    }
    if (!config) {
        err_ << ConfigModel::CONFIG_FILE << " is missing " << ConfigModel::SECTION << " config.\n";
        return EXIT_USAGE;
    }

    Reporter reporter = Reporter::from_env(out_, err_);
    if (flags.count("--verbose")) reporter.set_threshold(Reporter::Level::Debug);
    reporter.debug(std::string("Configured mode: ") + to_string(config->mode) + ", validating with mode=always");

    ResolverOptions options = ResolverOptions::from_env();
    std::unique_ptr<CurlHttpClient> curl;
    HttpClient* http = http_;
    if (!http) {
        curl = std::make_unique<CurlHttpClient>(options.http_timeout);
        http = curl.get();
    }
    RustupProbe toolchain;
    FallbackPolicy policy(*http, toolchain, options, reporter);

    Resolution result = policy.resolve(request);
    if (!result.downloaded()) {
        err_ << "Validation failed (" << to_string(result.kind) << "): " << result.reason << "\n";
        return result.error == ErrorKind::ConfigInvalid ? EXIT_USAGE : EXIT_FAILED;
    }

    out_ << "Validated precompiled artifact:\n"
         << "  crateDir: " << dir.lexically_normal().string() << "\n"
         << "  buildId: " << result.build_id << "\n"
         << "  target: " << result.target_triple << "\n"
         << "  artifact: " << result.artifact_name << "\n"
         << "  library: " << result.library.string() << "\n";
    return EXIT_OK;
}

// ============================================================================
// build-id, keygen, sign, verify
// ============================================================================

int CommandLine::build_id(const std::vector<std::string>& args) {
    auto flags = parse_flags(args, {"--crate-dir"});
    if (flags.count("--help")) {
        print_usage(out_);
        return EXIT_OK;
    }
    out_ << BuildIdentityHasher::compute_build_id(crate_dir(flags)) << "\n";
    return EXIT_OK;
}

int CommandLine::keygen(const std::vector<std::string>& args) {
    if (!args.empty()) throw UsageError("keygen takes no arguments");
    KeyPair pair = Ed25519Signer::generate();
    out_ << "public_key=" << encode_hex(pair.public_key.data(), pair.public_key.size()) << "\n"
         << "private_key=" << encode_hex(pair.private_key.data(), pair.private_key.size()) << "\n";
    return EXIT_OK;
}

int CommandLine::sign(const std::vector<std::string>& args) {
    auto flags = parse_flags(args, {"--file", "--private-key", "--out"});
    if (flags.count("--help")) {
        print_usage(out_);
        return EXIT_OK;
    }

    fs::path file = required(flags, "--file");
    auto key = Ed25519Signer::parse_private_key_hex(required(flags, "--private-key"));
    if (!key) throw UsageError("--private-key must be 64 bytes of hex (seed followed by public key)");

    fs::path out = flags.count("--out") ? fs::path(flags["--out"]) : fs::path(file.string() + ".sig");
    std::vector<uint8_t> signature = Ed25519Signer::sign(*key, FileIO::read_bytes(file));
    FileIO::write_atomic(out, signature);

    out_ << "Wrote " << out.string() << "\n"
         << "  sha256: " << SHA256Pipeline::to_hex(SHA256Pipeline::hash_file(file)) << "\n"
         << "  signature: " << encode_hex(signature) << "\n";
    return EXIT_OK;
}

int CommandLine::verify(const std::vector<std::string>& args) {
    auto flags = parse_flags(args, {"--file", "--signature", "--public-key"});
    if (flags.count("--help")) {
        print_usage(out_);
        return EXIT_OK;
    }

    auto key = SignatureVerifier::parse_public_key_hex(required(flags, "--public-key"));
    if (!key) throw UsageError("--public-key must be 32 bytes of hex");

    SignatureVerifier verifier(*key);
    bool ok = verifier.verify(FileIO::read_bytes(required(flags, "--file")),
                              FileIO::read_bytes(required(flags, "--signature")));
    out_ << (ok ? "Signature valid" : "Signature INVALID") << "\n";
    return ok ? EXIT_OK : EXIT_FAILED;
}

} // namespace Prebuilt
