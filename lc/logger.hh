#pragma once

#include <iostream>
#include <string>

namespace lumata::driver {

enum class LogLevel {
    Quiet,   // Errors only
    Normal,  // Errors, warnings, info, success
    Verbose, // + verbose messages
    Debug    // + debug messages
};

enum class ColorMode {
    Auto,    // Auto-detect TTY
    Always,  // Force colors
    Never    // Disable colors
};

/// Parse --color=<mode>; throws std::runtime_error on an unknown mode
ColorMode parse_color_mode(const std::string& text);

/**
 * Simple logger for CLI output with color support.
 * Uses termcolor for automatic TTY detection and color handling.
 *
 * Output routing:
 * - Errors, warnings → diagnostics stream (stderr)
 * - Info, success, verbose, debug → message stream (stdout, or stderr when
 *   generated code is written to stdout)
 */
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Normal,
                    ColorMode color = ColorMode::Auto,
                    std::ostream& messages = std::cout,
                    std::ostream& diagnostics = std::cerr);

    void error(const std::string& message);
    void warning(const std::string& message);
    void info(const std::string& message);
    void success(const std::string& message);
    void verbose(const std::string& message);
    void debug(const std::string& message);

    void bullet(const std::string& message, LogLevel min_level = LogLevel::Normal);

    /// Send info/success/verbose/debug to another stream
    void redirect_messages(std::ostream& messages);

    void set_level(LogLevel level) { level_ = level; }
    LogLevel get_level() const { return level_; }

private:
    LogLevel level_;
    ColorMode color_mode_;
    std::ostream* messages_;
    std::ostream* diagnostics_;

    bool should_log(LogLevel required_level) const;
    void apply_color_mode(std::ostream& stream) const;
};

} // namespace lumata::driver
