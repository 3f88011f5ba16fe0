/**
 * @file command_line.hpp
 * @brief Release maintenance commands behind the prebuilt executable
 */

#pragma once

#include <net/http_client.hpp>
#include <export.hpp>
#include <iostream>
#include <string>
#include <vector>

namespace Prebuilt {

/**
 * @brief Dispatches validate-precompiled, build-id, keygen, sign and verify.
 *
 * Exit codes: 0 success, 1 the operation failed, 2 bad arguments or
 * configuration.
 */
class PREBUILT_API CommandLine {
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_FAILED = 1;
    static constexpr int EXIT_USAGE = 2;

    CommandLine(std::ostream& out = std::cout, std::ostream& err = std::cerr) : out_(out), err_(err) {}

    /**
     * @brief Transport for validate-precompiled; libcurl when unset.
     */
    void set_http_client(HttpClient& http) { http_ = &http; }

    /**
     * @param args arguments after the program name
     */
    int run(const std::vector<std::string>& args);

private:
    int validate_precompiled(const std::vector<std::string>& args);
    int build_id(const std::vector<std::string>& args);
    int keygen(const std::vector<std::string>& args);
    int sign(const std::vector<std::string>& args);
    int verify(const std::vector<std::string>& args);
    void print_usage(std::ostream& stream) const;

    std::ostream& out_;
    std::ostream& err_;
    HttpClient* http_ = nullptr;
};

} // namespace Prebuilt
