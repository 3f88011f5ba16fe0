#pragma once

#include "fake_http_client.hpp"
#include <config/config_model.hpp>
#include <crypto/signature_verifier.hpp>
#include <utils/hex.hpp>
#include <array>
#include <string>
#include <vector>

namespace Prebuilt::Testing {

/**
 * Signing key plus a fake release host. publish() serves a file and its
 * detached signature under <prefix><build_id>/<name>.
 */
struct ReleaseFixture {
    static constexpr const char* URL_PREFIX = "https://releases.example.test/";

    FakeHttpClient http;
    KeyPair keys = Ed25519Signer::from_seed(seed(0x42));

    static std::array<uint8_t, 32> seed(uint8_t fill) {
        std::array<uint8_t, 32> s{};
        s.fill(fill);
        return s;
    }

    std::string url(const std::string& build_id, const std::string& name) const {
        return std::string(URL_PREFIX) + build_id + "/" + name;
    }

    void publish(const std::string& build_id, const std::string& name, const std::vector<uint8_t>& bytes) {
        http.serve(url(build_id, name), bytes);
        http.serve(url(build_id, name) + ".sig", Ed25519Signer::sign(keys.private_key, bytes));
    }

    void publish(const std::string& build_id, const std::string& name, const std::string& text) {
        publish(build_id, name, std::vector<uint8_t>(text.begin(), text.end()));
    }

    std::string public_key_hex() const {
        return encode_hex(keys.public_key.data(), keys.public_key.size());
    }

    /// xforge.yaml pointing at this host
    std::string config_yaml(const std::string& mode = "auto") const {
        return "precompiled_binaries:\n"
               "  repository: acme/widgets\n"
               "  public_key: " + public_key_hex() + "\n"
               "  url_prefix: " + URL_PREFIX + "\n"
               "  mode: " + mode + "\n";
    }

    PrecompiledConfig config() const {
        PrecompiledConfig c;
        c.repository = "acme/widgets";
        c.public_key = keys.public_key;
        c.url_prefix = URL_PREFIX;
        return c;
    }

    static std::string manifest_json(const std::string& build_id, const std::string& triple,
                                     const std::string& artifact) {
        return "{\"build\":{\"id\":\"" + build_id + "\"},\"platforms\":{\"targets\":[{\"name\":\"" + triple +
               "\",\"triples\":[\"" + triple + "\"],\"artifacts\":[\"" + artifact + "\"]}]}}";
    }
};

} // namespace Prebuilt::Testing
