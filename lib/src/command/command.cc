//
// Command construction rules
//

#include <promptgen/command.hh>
#include <promptgen/errors.hh>

#include <algorithm>
#include <atomic>
#include <stdexcept>

namespace promptgen {
    namespace {
        std::string trim(const std::string& text) {
            const auto first = text.find_first_not_of(" \t\r\n");
            if (first == std::string::npos) {
                return {};
            }
            const auto last = text.find_last_not_of(" \t\r\n");
            return text.substr(first, last - first + 1);
        }
    }

    const char* to_string(sampling_method method) {
        switch (method) {
            case sampling_method::random: return "random";
            case sampling_method::combinatorial: return "combinatorial";
            case sampling_method::cyclical: return "cyclical";
        }
        return "unknown";
    }

    std::optional<sampling_method> sampling_method_from_symbol(char symbol) {
        switch (symbol) {
            case '~': return sampling_method::random;
            case '!': return sampling_method::combinatorial;
            case '@': return sampling_method::cyclical;
            default: return std::nullopt;
        }
    }

    std::optional<sampling_method> sampling_method_from_name(const std::string& name) {
        if (name == "random") return sampling_method::random;
        if (name == "combinatorial") return sampling_method::combinatorial;
        if (name == "cyclical") return sampling_method::cyclical;
        return std::nullopt;
    }

    node_id next_node_id() {
        static std::atomic<node_id> counter{1};
        return counter.fetch_add(1, std::memory_order_relaxed);
    }

    command make_literal(std::string text) {
        return command{command_node{literal_command{std::move(text)}}};
    }

    command make_sequence(std::vector<command> children) {
        if (children.empty()) {
            return make_literal("");
        }
        if (children.size() == 1) {
            return std::move(children.front());
        }
        return command{command_node{sequence_command{std::move(children)}}};
    }

    variant_option make_option(command value, double weight) {
        if (weight < 0.0) {
            throw std::invalid_argument("Variant option weight must not be negative");
        }
        return variant_option{std::make_unique<command>(std::move(value)), weight};
    }

    command make_variant(std::vector<variant_option> options,
                         std::size_t min_bound,
                         std::size_t max_bound,
                         std::string separator,
                         std::optional<sampling_method> method) {
        if (min_bound > max_bound) {
            throw invalid_bound_error("Variant lower bound " + std::to_string(min_bound) +
                                      " exceeds upper bound " + std::to_string(max_bound),
                                      0, 0, 0, min_bound, max_bound);
        }

        const std::size_t count = std::max<std::size_t>(options.size(), 1);
        min_bound = std::clamp<std::size_t>(min_bound, 1, count);
        max_bound = std::clamp<std::size_t>(max_bound, min_bound, count);

        return command{command_node{variant_command{
            next_node_id(),
            std::move(options),
            min_bound,
            max_bound,
            std::move(separator),
            method
        }}};
    }

    command make_wildcard(command path,
                          std::optional<sampling_method> method,
                          std::map<std::string, std::unique_ptr<command>> variables) {
        wildcard_command wildcard{next_node_id(), {}, nullptr, method, std::move(variables)};
        if (const auto* text = literal_text(path)) {
            wildcard.name = trim(*text);
        } else {
            wildcard.dynamic_name = std::make_unique<command>(std::move(path));
        }
        return command{command_node{std::move(wildcard)}};
    }

    command make_wrap(command wrapper, command inner) {
        return command{command_node{wrap_command{
            std::make_unique<command>(std::move(wrapper)),
            std::make_unique<command>(std::move(inner))
        }}};
    }

    command make_probability(double chance, command value, std::optional<sampling_method> method) {
        if (!(chance >= 0.0 && chance <= 1.0)) {
            throw std::invalid_argument("Probability must lie in [0, 1]");
        }
        return command{command_node{probability_command{
            next_node_id(),
            chance,
            std::make_unique<command>(std::move(value)),
            method
        }}};
    }

    condition_arm make_condition_arm(std::string pattern, command value,
                                     std::optional<std::string> context_key) {
        std::regex matcher(pattern, std::regex::ECMAScript);
        return condition_arm{
            std::move(context_key),
            std::move(pattern),
            std::move(matcher),
            std::make_unique<command>(std::move(value))
        };
    }

    command make_condition(std::vector<condition_arm> arms, command else_value) {
        return command{command_node{condition_command{
            std::move(arms),
            std::make_unique<command>(std::move(else_value))
        }}};
    }

    command make_comment(std::string text) {
        return command{command_node{comment_command{std::move(text)}}};
    }

    command make_variable_access(std::string name, std::unique_ptr<command> default_value) {
        return command{command_node{variable_access_command{std::move(name), std::move(default_value)}}};
    }

    command make_variable_assignment(std::string name, command value, bool overwrite, bool immediate) {
        return command{command_node{variable_assignment_command{
            std::move(name),
            std::make_unique<command>(std::move(value)),
            overwrite,
            immediate
        }}};
    }

    bool is_literal(const command& cmd) {
        return std::holds_alternative<literal_command>(cmd.node);
    }

    const std::string* literal_text(const command& cmd) {
        if (const auto* lit = std::get_if<literal_command>(&cmd.node)) {
            return &lit->text;
        }
        return nullptr;
    }
}
