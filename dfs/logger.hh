#pragma once

#include <iostream>
#include <string>

namespace dfscan::driver {

enum class LogLevel {
    Quiet,   // Errors only
    Normal,  // Errors, warnings, info
    Verbose, // + verbose messages
    Debug    // + debug messages
};

enum class ColorMode {
    Auto,    // Auto-detect TTY
    Always,  // Force colors
    Never    // Disable colors
};

/**
 * Console logger for the dfscan driver.
 * Colouring goes through termcolor, which also does the TTY detection.
 *
 * Only info() writes to stdout, which carries the report. Everything else
 * goes to stderr.
 */
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Normal,
                   ColorMode color = ColorMode::Auto);

    void error(const std::string& message);
    void warning(const std::string& message);
    void note(const std::string& message);
    void info(const std::string& message);
    void verbose(const std::string& message);
    void debug(const std::string& message);

private:
    LogLevel level_;
    ColorMode color_mode_;

    bool should_log(LogLevel required_level) const;
};

} // namespace dfscan::driver
