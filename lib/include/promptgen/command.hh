//
// Command tree produced by the parser and walked by the generator.
//

#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace promptgen {
    enum class sampling_method {
        random,        // ~  independent weighted draw on every visit
        combinatorial, // !  exhaustive, deduplicated enumeration
        cyclical       // @  deterministic round-robin
    };

    const char* to_string(sampling_method method);
    std::optional<sampling_method> sampling_method_from_symbol(char symbol);
    std::optional<sampling_method> sampling_method_from_name(const std::string& name);

    // Identity of a stateful node (variant, wildcard, probability). Unique for
    // the whole process, so cyclical positions can live in a side table that
    // survives moves of the tree.
    using node_id = std::uint64_t;
    node_id next_node_id();

    struct command;

    struct literal_command {
        std::string text;
    };

    struct sequence_command {
        std::vector<command> children;
    };

    struct variant_option {
        std::unique_ptr<command> value;
        double weight = 1.0;
    };

    struct variant_command {
        node_id id;
        std::vector<variant_option> options;
        std::size_t min_bound = 1;
        std::size_t max_bound = 1;
        std::string separator = ",";
        std::optional<sampling_method> method;
    };

    struct wildcard_command {
        node_id id;
        std::string name;                        // Static name
        std::unique_ptr<command> dynamic_name;   // Set when the path embeds directives
        std::optional<sampling_method> method;
        std::map<std::string, std::unique_ptr<command>> variables;
    };

    struct wrap_command {
        std::unique_ptr<command> wrapper;
        std::unique_ptr<command> inner;
    };

    struct probability_command {
        node_id id;
        double chance;  // [0, 1]
        std::unique_ptr<command> value;
        std::optional<sampling_method> method;
    };

    struct condition_arm {
        std::optional<std::string> context_key;  // Variable tested instead of the ambient text
        std::string pattern;
        std::regex matcher;
        std::unique_ptr<command> value;
    };

    struct condition_command {
        std::vector<condition_arm> arms;
        std::unique_ptr<command> else_value;
    };

    struct comment_command {
        std::string text;
    };

    struct variable_access_command {
        std::string name;
        std::unique_ptr<command> default_value;  // May be null: unbound renders empty
    };

    struct variable_assignment_command {
        std::string name;
        std::unique_ptr<command> value;
        bool overwrite = true;
        bool immediate = false;
    };

    using command_node = std::variant <
        literal_command,
        sequence_command,
        variant_command,
        wildcard_command,
        wrap_command,
        probability_command,
        condition_command,
        comment_command,
        variable_access_command,
        variable_assignment_command
    >;

    struct command {
        command_node node;
    };

    // ------------------------------------------------------------------
    // Construction rules shared by the parser and programmatic callers
    // ------------------------------------------------------------------

    command make_literal(std::string text);

    // Zero children collapse to an empty literal, one child to the child itself
    command make_sequence(std::vector<command> children);

    // Bounds are clamped into [1, options.size()]; throws invalid_bound_error
    // when min_bound > max_bound before clamping.
    command make_variant(std::vector<variant_option> options,
                         std::size_t min_bound = 1,
                         std::size_t max_bound = 1,
                         std::string separator = ",",
                         std::optional<sampling_method> method = std::nullopt);

    variant_option make_option(command value, double weight = 1.0);

    // A literal path is simplified to a plain (trimmed) name
    command make_wildcard(command path,
                          std::optional<sampling_method> method = std::nullopt,
                          std::map<std::string, std::unique_ptr<command>> variables = {});

    command make_wrap(command wrapper, command inner);

    // Throws std::invalid_argument when chance lies outside [0, 1]
    command make_probability(double chance, command value,
                             std::optional<sampling_method> method = std::nullopt);

    // Throws std::regex_error for an invalid pattern
    condition_arm make_condition_arm(std::string pattern, command value,
                                     std::optional<std::string> context_key = std::nullopt);

    command make_condition(std::vector<condition_arm> arms, command else_value);
    command make_comment(std::string text);
    command make_variable_access(std::string name, std::unique_ptr<command> default_value = nullptr);
    command make_variable_assignment(std::string name, command value,
                                     bool overwrite = true, bool immediate = false);

    // Helpers
    [[nodiscard]] bool is_literal(const command& cmd);
    [[nodiscard]] const std::string* literal_text(const command& cmd);
}
