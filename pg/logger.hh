#pragma once

#include <iostream>
#include <string>
#include <string_view>

#include <promptgen/errors.hh>

namespace promptgen::driver {

enum class LogLevel {
    Quiet,   // Errors only
    Normal,  // Errors, warnings, info
    Verbose, // + verbose messages
    Debug    // + debug messages
};

enum class ColorMode {
    Auto,    // Colour only when the stream is a terminal
    Always,
    Never
};

/**
 * Diagnostics and prompt output of the pg driver.
 *
 * Diagnostics (errors, warnings) go to the error stream, everything else to
 * the output stream. Generated prompts are written at every level, so
 * `pg -q` still prints them.
 */
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Normal,
                    ColorMode color = ColorMode::Auto,
                    std::ostream& out = std::cout,
                    std::ostream& err = std::cerr);

    void error(const std::string& message);
    void warning(const std::string& message);
    void info(const std::string& message);
    void verbose(const std::string& message);
    void debug(const std::string& message);

    // Parse failure with the offending template line and a caret under the column
    void syntax_error(const promptgen::syntax_error& e, std::string_view source);

    // Generated prompt or dump text
    void output(const std::string& text);

    void set_level(LogLevel level) { level_ = level; }
    LogLevel get_level() const { return level_; }

private:
    LogLevel level_;
    std::ostream& out_;
    std::ostream& err_;

    bool should_log(LogLevel required_level) const;
};

} // namespace promptgen::driver
