#pragma once

#include <export.hpp>
#include <filesystem>
#include <optional>

namespace Prebuilt {

/**
 * @brief Answers whether a local build is possible at all.
 */
class ToolchainProbe {
public:
    virtual ~ToolchainProbe() = default;
    virtual bool available() const = 0;
};

/**
 * @brief Looks for rustup in $CARGO_HOME/bin, ~/.cargo/bin and every PATH entry.
 */
class PREBUILT_API RustupProbe : public ToolchainProbe {
public:
    bool available() const override { return locate().has_value(); }

    std::optional<std::filesystem::path> locate() const;
};

} // namespace Prebuilt
