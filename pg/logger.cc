#include "logger.hh"
#include <termcolor/termcolor.hpp>

namespace promptgen::driver {

namespace {

// Text of 1-based line `line`, without its line break
std::string_view source_line(std::string_view source, int line) {
    std::size_t begin = 0;
    for (int current = 1; current < line; ++current) {
        const auto newline = source.find('\n', begin);
        if (newline == std::string_view::npos) {
            return {};
        }
        begin = newline + 1;
    }
    auto end = source.find('\n', begin);
    if (end == std::string_view::npos) {
        end = source.size();
    }
    if (end > begin && source[end - 1] == '\r') {
        --end;
    }
    return source.substr(begin, end - begin);
}

} // namespace

Logger::Logger(LogLevel level, ColorMode color, std::ostream& out, std::ostream& err)
    : level_(level)
    , out_(out)
    , err_(err)
{
    switch (color) {
        case ColorMode::Always:
            out_ << termcolor::colorize;
            err_ << termcolor::colorize;
            break;
        case ColorMode::Never:
            out_ << termcolor::nocolorize;
            err_ << termcolor::nocolorize;
            break;
        case ColorMode::Auto:
            break;
    }
}

bool Logger::should_log(LogLevel required_level) const {
    return static_cast<int>(level_) >= static_cast<int>(required_level);
}

void Logger::error(const std::string& message) {
    err_ << termcolor::bold << termcolor::red
         << "error: " << termcolor::reset
         << message << "\n";
}

void Logger::warning(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    err_ << termcolor::bold << termcolor::yellow
         << "warning: " << termcolor::reset
         << message << "\n";
}

void Logger::info(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    out_ << message << "\n";
}

void Logger::verbose(const std::string& message) {
    if (!should_log(LogLevel::Verbose)) return;

    out_ << termcolor::cyan << message << termcolor::reset << "\n";
}

void Logger::debug(const std::string& message) {
    if (!should_log(LogLevel::Debug)) return;

    out_ << termcolor::magenta << "[debug] " << termcolor::reset
         << message << "\n";
}

void Logger::syntax_error(const promptgen::syntax_error& e, std::string_view source) {
    error(e.what());

    const auto line = source_line(source, e.line());
    if (line.empty()) {
        return;
    }

    // Tabs are kept in the caret line so the caret stays aligned
    std::string marker;
    for (std::size_t i = 0; i + 1 < static_cast<std::size_t>(e.column()) && i < line.size(); ++i) {
        marker += (line[i] == '\t') ? '\t' : ' ';
    }

    err_ << "  " << line << "\n"
         << "  " << marker << termcolor::bold << termcolor::green << "^" << termcolor::reset << "\n";
}

void Logger::output(const std::string& text) {
    out_ << text << "\n";
}

} // namespace promptgen::driver
