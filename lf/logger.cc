#include "logger.hh"
#include <termcolor/termcolor.hpp>

namespace litfix::driver {

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
            // termcolor checks isatty on every manipulator
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

void Logger::success(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    std::cout << termcolor::bold << termcolor::green
              << "✓ " << termcolor::reset
              << message << "\n";
}

void Logger::verbose(const std::string& message) {
    if (!should_log(LogLevel::Verbose)) return;

    std::cout << termcolor::cyan
              << message << termcolor::reset << "\n";
}

void Logger::report(const litfix::diagnostic& diag) {
    switch (diag.level) {
        case diagnostic_level::error:
            if (!should_log(LogLevel::Quiet)) return;
            break;
        case diagnostic_level::warning:
            if (!should_log(LogLevel::Normal)) return;
            break;
        case diagnostic_level::note:
            if (!should_log(LogLevel::Verbose)) return;
            break;
    }

    std::cerr << termcolor::bold << diag.file << ":" << diag.position.line << ":"
              << diag.position.column << ": " << termcolor::reset;

    switch (diag.level) {
        case diagnostic_level::error:
            std::cerr << termcolor::bold << termcolor::red << "error: ";
            break;
        case diagnostic_level::warning:
            std::cerr << termcolor::bold << termcolor::yellow << "warning: ";
            break;
        case diagnostic_level::note:
            std::cerr << termcolor::bold << termcolor::cyan << "note: ";
            break;
    }

    std::cerr << termcolor::reset << diag.message;
    if (!diag.code.empty()) {
        std::cerr << termcolor::grey << " [" << diag.code << "]" << termcolor::reset;
    }
    std::cerr << "\n";
}

void Logger::bullet(const std::string& message, LogLevel min_level) {
    if (!should_log(min_level)) return;

    std::cout << "  • " << message << "\n";
}

void Logger::heading(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    std::cout << termcolor::bold
              << message << termcolor::reset << "\n";
}

} // namespace litfix::driver
