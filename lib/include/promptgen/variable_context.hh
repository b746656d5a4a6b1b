//
// Variable scope used while rendering a single output.
//

#pragma once

#include <map>
#include <string>
#include <variant>

#include "command.hh"

namespace promptgen {
    /**
     * Mapping from variable name to its binding.
     *
     * A binding is either an already evaluated string (immediate assignment)
     * or a deferred command that is rendered again on every access. Deferred
     * bindings point into a command tree that must outlive the context.
     *
     * Scopes chain to an optional parent: lookups fall through to the parent,
     * writes always land in the innermost scope.
     */
    class variable_context {
        public:
            using deferred = const command*;
            using binding = std::variant<std::string, deferred>;

            variable_context() = default;
            explicit variable_context(const variable_context* parent);

            [[nodiscard]] const binding* find(const std::string& name) const;
            [[nodiscard]] bool contains(const std::string& name) const;

            // Returns false when overwrite is off and the name is already visible
            bool assign(const std::string& name, binding value, bool overwrite = true);

            [[nodiscard]] std::size_t size() const { return m_bindings.size(); }
            [[nodiscard]] const variable_context* parent() const { return m_parent; }

        private:
            const variable_context* m_parent = nullptr;
            std::map<std::string, binding> m_bindings;
    };
}
