#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <promptgen/command.hh>
#include <promptgen/generator.hh>
#include <promptgen/grammar_config.hh>

#include "logger.hh"

namespace promptgen::driver {

/// Driver configuration
struct DriverOptions {
    // ========================================================================
    // Template Input
    // ========================================================================

    std::optional<std::string> inline_template;        // -e <template>
    std::optional<std::filesystem::path> template_file;
    std::vector<std::filesystem::path> wildcard_dirs;  // -W paths

    // ========================================================================
    // Generation
    // ========================================================================

    std::size_t count = 1;                             // -n
    sampling_method method = sampling_method::random;  // -m
    std::optional<std::uint64_t> seed;                 // -s
    empty_wildcard_policy empty_wildcards = empty_wildcard_policy::error;
    grammar_config grammar;                            // --variant-start= etc.

    // ========================================================================
    // Diagnostics and Output
    // ========================================================================

    bool verbose = false;                              // -v, --verbose
    bool quiet = false;                                // -q, --quiet
    bool debug = false;                                // --debug
    ColorMode color = ColorMode::Auto;                 // --color=
    bool dump_tree = false;                            // --dump-tree

    bool show_help = false;                            // -h, --help
    bool show_version = false;                         // --version
};

/// Parse command-line arguments
/// Throws std::runtime_error on invalid arguments
DriverOptions parse_command_line(int argc, char** argv);

/// Print help message
void print_help(const char* program_name);

/// Print version information
void print_version();

}  // namespace promptgen::driver
