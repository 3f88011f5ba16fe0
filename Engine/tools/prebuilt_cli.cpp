/**
 * @file prebuilt_cli.cpp
 * @brief Release maintenance tool: validate releases, compute build ids, sign
 */

#include <cli/command_line.hpp>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    Prebuilt::CommandLine cli;
    return cli.run(args);
}
