#include "logger.hh"
#include <termcolor/termcolor.hpp>

namespace dfscan::driver {

Logger::Logger(LogLevel level, ColorMode color)
    : level_(level)
    , color_mode_(color)
{
    switch (color_mode_) {
        case ColorMode::Always:
            std::cout << termcolor::colorize;
            std::cerr << termcolor::colorize;
            break;
        case ColorMode::Never:
            std::cout << termcolor::nocolorize;
            std::cerr << termcolor::nocolorize;
            break;
        case ColorMode::Auto:
            break;
    }
}

bool Logger::should_log(LogLevel required_level) const {
    return static_cast<int>(level_) >= static_cast<int>(required_level);
}

void Logger::error(const std::string& message) {
    if (!should_log(LogLevel::Quiet)) return;

    std::cerr << termcolor::bold << termcolor::red
              << "error: " << termcolor::reset
              << message << "\n";
}

void Logger::warning(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    std::cerr << termcolor::bold << termcolor::yellow
              << "warning: " << termcolor::reset
              << message << "\n";
}

void Logger::note(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    std::cerr << termcolor::bold << termcolor::blue
              << "note: " << termcolor::reset
              << message << "\n";
}

void Logger::info(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    std::cout << message << "\n";
}

void Logger::verbose(const std::string& message) {
    if (!should_log(LogLevel::Verbose)) return;

    std::cerr << termcolor::cyan
              << message << termcolor::reset << "\n";
}

void Logger::debug(const std::string& message) {
    if (!should_log(LogLevel::Debug)) return;

    std::cerr << termcolor::magenta
              << "[debug] " << termcolor::reset
              << message << "\n";
}

} // namespace dfscan::driver
