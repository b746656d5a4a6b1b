//
// Command tree dump
//

#include <promptgen/command_dump.hh>

#include "command/tree_writer.hh"

#include <sstream>

namespace promptgen {
    namespace {
        std::string format_weight(double value) {
            std::ostringstream oss;
            oss << value;
            return oss.str();
        }

        std::string method_suffix(const std::optional<sampling_method>& method) {
            return method ? std::string(" method=") + to_string(*method) : std::string();
        }

        void dump_node(dump::TreeWriter& w, const command& cmd);

        void dump_labelled(dump::TreeWriter& w, const std::string& label, const command& cmd) {
            auto block = w.write_node(label + ":");
            dump_node(w, cmd);
        }

        void dump_node(dump::TreeWriter& w, const command& cmd) {
            if (const auto* literal = std::get_if<literal_command>(&cmd.node)) {
                w.write_line("literal " + dump::quote(literal->text));
            }
            else if (const auto* sequence = std::get_if<sequence_command>(&cmd.node)) {
                auto block = w.write_node("sequence");
                for (const auto& child : sequence->children) {
                    dump_node(w, child);
                }
            }
            else if (const auto* variant = std::get_if<variant_command>(&cmd.node)) {
                auto block = w.write_node("variant bound=" + std::to_string(variant->min_bound) + "-" +
                                          std::to_string(variant->max_bound) +
                                          " separator=" + dump::quote(variant->separator) +
                                          method_suffix(variant->method));
                for (const auto& option : variant->options) {
                    dump_labelled(w, "option weight=" + format_weight(option.weight), *option.value);
                }
            }
            else if (const auto* wildcard = std::get_if<wildcard_command>(&cmd.node)) {
                if (wildcard->dynamic_name) {
                    auto block = w.write_node("wildcard" + method_suffix(wildcard->method));
                    dump_labelled(w, "name", *wildcard->dynamic_name);
                    for (const auto& [name, value] : wildcard->variables) {
                        dump_labelled(w, "variable " + name, *value);
                    }
                } else {
                    auto block = w.write_node("wildcard " + dump::quote(wildcard->name) + method_suffix(wildcard->method));
                    for (const auto& [name, value] : wildcard->variables) {
                        dump_labelled(w, "variable " + name, *value);
                    }
                }
            }
            else if (const auto* wrap = std::get_if<wrap_command>(&cmd.node)) {
                auto block = w.write_node("wrap");
                dump_labelled(w, "wrapper", *wrap->wrapper);
                dump_labelled(w, "inner", *wrap->inner);
            }
            else if (const auto* probability = std::get_if<probability_command>(&cmd.node)) {
                auto block = w.write_node("probability chance=" + format_weight(probability->chance) +
                                          method_suffix(probability->method));
                dump_node(w, *probability->value);
            }
            else if (const auto* condition = std::get_if<condition_command>(&cmd.node)) {
                auto block = w.write_node("condition");
                for (const auto& arm : condition->arms) {
                    std::string label = "if " + dump::quote(arm.pattern);
                    if (arm.context_key) {
                        label += " in ${" + *arm.context_key + "}";
                    }
                    dump_labelled(w, label, *arm.value);
                }
                dump_labelled(w, "else", *condition->else_value);
            }
            else if (const auto* comment = std::get_if<comment_command>(&cmd.node)) {
                w.write_line("comment " + dump::quote(comment->text));
            }
            else if (const auto* access = std::get_if<variable_access_command>(&cmd.node)) {
                if (access->default_value) {
                    auto block = w.write_node("variable " + access->name);
                    dump_labelled(w, "default", *access->default_value);
                } else {
                    w.write_line("variable " + access->name);
                }
            }
            else if (const auto* assignment = std::get_if<variable_assignment_command>(&cmd.node)) {
                std::string label = "assign " + assignment->name;
                if (!assignment->overwrite) label += " preserve";
                if (assignment->immediate) label += " immediate";
                auto block = w.write_node(label);
                dump_node(w, *assignment->value);
            }
        }
    }

    void dump_command(std::ostream& out, const command& cmd) {
        dump::TreeWriter writer(out);
        dump_node(writer, cmd);
    }

    std::string dump_command(const command& cmd) {
        std::ostringstream oss;
        dump_command(oss, cmd);
        return oss.str();
    }
}
