#pragma once

#include <iostream>
#include <string>
#include <mutex>
#include <cstdlib>

namespace Prebuilt {

/**
 * @brief Thread-safe reporting handle for resolution progress.
 *
 * One instance is created by the host (CLI, build hook) and passed by
 * reference into every component; nothing in the engine logs through a
 * global. Warnings and errors go to the error stream, everything else to the
 * output stream.
 */
class Reporter {
public:
    enum class Level {
        Debug,
        Info,
        Step,
        Success,
        Warning,
        Error
    };

    explicit Reporter(Level threshold = Level::Info, bool color = true)
        : Reporter(std::cout, std::cerr, threshold, color) {}

    Reporter(std::ostream& out, std::ostream& err, Level threshold = Level::Info, bool color = false)
        : out_(&out), err_(&err), threshold_(threshold), color_(color) {}

    Reporter(const Reporter&) = delete;
    Reporter& operator=(const Reporter&) = delete;

    /**
     * @brief Reporter configured from PREBUILT_VERBOSE and NO_COLOR.
     */
    static Reporter from_env() {
        return from_env(std::cout, std::cerr);
    }

    static Reporter from_env(std::ostream& out, std::ostream& err) {
        const char* verbose = std::getenv("PREBUILT_VERBOSE");
        const char* no_color = std::getenv("NO_COLOR");
        bool is_verbose = verbose && (std::string(verbose) == "1" || std::string(verbose) == "true");
        return Reporter(out, err, is_verbose ? Level::Debug : Level::Info, no_color == nullptr);
    }

    /**
     * @brief Reporter that drops every message (tests, embedding hosts).
     */
    static Reporter silent() {
        return Reporter(std::cout, std::cerr, Level::Error, false, true);
    }

    void log(Level level, const std::string& message) {
        if (muted_ || level < threshold_) return;

        std::lock_guard<std::mutex> lock(mutex_);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;90m"; prefix = "    "; break; // Grey
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
        }

        std::ostream& stream = level >= Level::Warning ? *err_ : *out_;
        if (color_) {
            stream << color << prefix << message << "\033[0m" << std::endl;
        } else {
            stream << prefix << message << std::endl;
        }
    }

    void debug(const std::string& msg)   { log(Level::Debug, msg); }
    void info(const std::string& msg)    { log(Level::Info, msg); }
    void step(const std::string& msg)    { log(Level::Step, msg); }
    void success(const std::string& msg) { log(Level::Success, msg); }
    void warn(const std::string& msg)    { log(Level::Warning, msg); }
    void error(const std::string& msg)   { log(Level::Error, msg); }

    void set_threshold(Level level) { threshold_ = level; }

private:
    Reporter(std::ostream& out, std::ostream& err, Level threshold, bool color, bool muted)
        : out_(&out), err_(&err), threshold_(threshold), color_(color), muted_(muted) {}

    std::ostream* out_;
    std::ostream* err_;
    Level threshold_;
    bool color_;
    bool muted_ = false;
    std::mutex mutex_;
};

} // namespace Prebuilt
