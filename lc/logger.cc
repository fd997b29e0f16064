#include "logger.hh"
#include <termcolor/termcolor.hpp>
#include <stdexcept>

namespace lumata::driver {

ColorMode parse_color_mode(const std::string& text) {
    if (text == "auto") return ColorMode::Auto;
    if (text == "always") return ColorMode::Always;
    if (text == "never") return ColorMode::Never;
    throw std::runtime_error("Invalid color mode: " + text + " (expected: auto, always, never)");
}

Logger::Logger(LogLevel level, ColorMode color, std::ostream& messages, std::ostream& diagnostics)
    : level_(level)
    , color_mode_(color)
    , messages_(&messages)
    , diagnostics_(&diagnostics)
{
    apply_color_mode(*messages_);
    apply_color_mode(*diagnostics_);
}

void Logger::apply_color_mode(std::ostream& stream) const {
    switch (color_mode_) {
        case ColorMode::Always:
            stream << termcolor::colorize;
            break;
        case ColorMode::Never:
            stream << termcolor::nocolorize;
            break;
        case ColorMode::Auto:
            // termcolor auto-detects TTY by default, no action needed
            break;
    }
}

void Logger::redirect_messages(std::ostream& messages) {
    messages_ = &messages;
    apply_color_mode(*messages_);
}

bool Logger::should_log(LogLevel required_level) const {
    return static_cast<int>(level_) >= static_cast<int>(required_level);
}

void Logger::error(const std::string& message) {
    if (!should_log(LogLevel::Quiet)) return;

    *diagnostics_ << termcolor::bold << termcolor::red
                  << "error: " << termcolor::reset
                  << message << "\n";
}

void Logger::warning(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    *diagnostics_ << termcolor::bold << termcolor::yellow
                  << "warning: " << termcolor::reset
                  << message << "\n";
}

void Logger::info(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    *messages_ << message << "\n";
}

void Logger::success(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    *messages_ << termcolor::bold << termcolor::green
               << "✓ " << termcolor::reset
               << message << "\n";
}

void Logger::verbose(const std::string& message) {
    if (!should_log(LogLevel::Verbose)) return;

    *messages_ << termcolor::cyan
               << message << termcolor::reset << "\n";
}

void Logger::debug(const std::string& message) {
    if (!should_log(LogLevel::Debug)) return;

    *messages_ << termcolor::magenta
               << "[debug] " << termcolor::reset
               << message << "\n";
}

void Logger::bullet(const std::string& message, LogLevel min_level) {
    if (!should_log(min_level)) return;

    *messages_ << "  • " << message << "\n";
}

} // namespace lumata::driver
