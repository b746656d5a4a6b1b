#include "driver_options.hh"
#include <charconv>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace promptgen::driver {

// ============================================================================
// Helper Functions
// ============================================================================

static bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

static std::string get_option_value(const char* arg, const char* prefix) {
    return arg + std::strlen(prefix);
}

// Value glued to the flag (-n5) or in the next argument (-n 5)
static std::string take_value(int argc, char** argv, int& i, const char* flag) {
    std::string value = get_option_value(argv[i], flag);
    if (value.empty() && i + 1 < argc) {
        value = argv[++i];
    }
    if (value.empty()) {
        throw std::runtime_error(std::string("Option ") + flag + " requires argument");
    }
    return value;
}

template <typename T>
static T parse_unsigned(const std::string& text, const char* flag) {
    T value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        throw std::runtime_error(std::string("Invalid value for ") + flag + ": " + text);
    }
    return value;
}

// --variant-start=<text> and friends
static bool parse_delimiter_option(const char* arg, grammar_config& grammar) {
    struct delimiter_flag {
        const char* prefix;
        std::string grammar_config::* member;
    };
    static const delimiter_flag flags[] = {
        {"--variant-start=", &grammar_config::variant_start},
        {"--variant-end=", &grammar_config::variant_end},
        {"--wildcard-wrap=", &grammar_config::wildcard_wrap},
        {"--variable-start=", &grammar_config::variable_start},
        {"--variable-end=", &grammar_config::variable_end},
        {"--wrap-start=", &grammar_config::wrap_start},
        {"--wrap-end=", &grammar_config::wrap_end},
    };

    for (const auto& flag : flags) {
        if (starts_with(arg, flag.prefix)) {
            grammar.*(flag.member) = get_option_value(arg, flag.prefix);
            return true;
        }
    }
    return false;
}

// ============================================================================
// Main Parser
// ============================================================================

DriverOptions parse_command_line(int argc, char** argv) {
    DriverOptions opts;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        // Help options
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            opts.show_help = true;
            return opts;
        }

        // Version
        if (std::strcmp(arg, "--version") == 0) {
            opts.show_version = true;
            return opts;
        }

        // Verbosity
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
            continue;
        }

        if (std::strcmp(arg, "-q") == 0 || std::strcmp(arg, "--quiet") == 0) {
            opts.quiet = true;
            continue;
        }

        if (std::strcmp(arg, "--debug") == 0) {
            opts.debug = true;
            continue;
        }

        if (starts_with(arg, "--color=")) {
            std::string value = get_option_value(arg, "--color=");
            if (value == "auto") opts.color = ColorMode::Auto;
            else if (value == "always") opts.color = ColorMode::Always;
            else if (value == "never") opts.color = ColorMode::Never;
            else throw std::runtime_error("Invalid color mode: " + value + " (expected: auto, always, never)");
            continue;
        }

        if (std::strcmp(arg, "--dump-tree") == 0) {
            opts.dump_tree = true;
            continue;
        }

        // Grammar delimiters
        if (parse_delimiter_option(arg, opts.grammar)) {
            continue;
        }

        if (starts_with(arg, "--empty-wildcards=")) {
            std::string value = get_option_value(arg, "--empty-wildcards=");
            auto policy = empty_wildcard_policy_from_name(value);
            if (!policy) {
                throw std::runtime_error("Invalid empty wildcard policy: " + value + " (expected: error, empty)");
            }
            opts.empty_wildcards = *policy;
            continue;
        }

        // Inline template
        if (starts_with(arg, "-e")) {
            opts.inline_template = take_value(argc, argv, i, "-e");
            continue;
        }

        // Output count
        if (starts_with(arg, "-n")) {
            opts.count = parse_unsigned<std::size_t>(take_value(argc, argv, i, "-n"), "-n");
            continue;
        }

        // Sampling method
        if (starts_with(arg, "-m")) {
            std::string value = take_value(argc, argv, i, "-m");
            auto method = sampling_method_from_name(value);
            if (!method) {
                throw std::runtime_error("Unknown sampling method: " + value +
                                         " (expected: random, combinatorial, cyclical)");
            }
            opts.method = *method;
            continue;
        }

        // Random seed
        if (starts_with(arg, "-s")) {
            opts.seed = parse_unsigned<std::uint64_t>(take_value(argc, argv, i, "-s"), "-s");
            continue;
        }

        // Wildcard directories
        if (starts_with(arg, "-W")) {
            opts.wildcard_dirs.emplace_back(take_value(argc, argv, i, "-W"));
            continue;
        }

        // Unknown option starting with dash
        if (arg[0] == '-') {
            throw std::runtime_error(std::string("Unknown option: ") + arg);
        }

        // Template file
        if (opts.template_file) {
            throw std::runtime_error(std::string("Only one template file may be given: ") + arg);
        }
        opts.template_file = std::filesystem::path(arg);
    }

    // Validation
    if (!opts.inline_template && !opts.template_file) {
        throw std::runtime_error("No template specified (use -e <template> or a template file)");
    }

    if (opts.inline_template && opts.template_file) {
        throw std::runtime_error("Cannot specify both -e and a template file");
    }

    if (opts.quiet && (opts.verbose || opts.debug)) {
        throw std::runtime_error("Cannot specify both -q/--quiet and -v/--verbose");
    }

    return opts;
}

// ============================================================================
// Help and Info Functions
// ============================================================================

void print_help(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] (-e <template> | <template-file>)\n\n";

    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  --version               Show version information\n";
    std::cout << "\n";

    std::cout << "Generation:\n";
    std::cout << "  -e <template>           Template text given on the command line\n";
    std::cout << "  -n <count>              Number of prompts to generate (default: 1)\n";
    std::cout << "  -m <method>             random, combinatorial or cyclical (default: random)\n";
    std::cout << "  -s <seed>               Seed for random sampling\n";
    std::cout << "  -W <dir>                Add wildcard search directory\n";
    std::cout << "  --empty-wildcards=<p>   error or empty (default: error)\n";
    std::cout << "\n";

    std::cout << "Grammar:\n";
    std::cout << "  --variant-start=<s>     Default: {\n";
    std::cout << "  --variant-end=<s>       Default: }\n";
    std::cout << "  --wildcard-wrap=<s>     Default: __\n";
    std::cout << "  --variable-start=<s>    Default: ${\n";
    std::cout << "  --variable-end=<s>      Default: }\n";
    std::cout << "  --wrap-start=<s>        Default: %{\n";
    std::cout << "  --wrap-end=<s>          Default: }\n";
    std::cout << "\n";

    std::cout << "Diagnostics:\n";
    std::cout << "  -v, --verbose           Verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (errors only)\n";
    std::cout << "  --debug                 Debug output\n";
    std::cout << "  --color=<mode>          auto, always or never\n";
    std::cout << "  --dump-tree             Print the parsed command tree and exit\n";
    std::cout << "\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " -e \"a {red|green|blue} ball\" -n 3\n";
    std::cout << "  " << program_name << " -m combinatorial -W wildcards prompt.txt\n";
    std::cout << "  " << program_name << " --dump-tree -e \"{2$$,$$x|y|z}\"\n";
}

void print_version() {
    std::cout << "promptgen v0.1.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

}  // namespace promptgen::driver
