//
// Variable scopes
//

#include <promptgen/variable_context.hh>

namespace promptgen {
    variable_context::variable_context(const variable_context* parent)
        : m_parent(parent) {
    }

    const variable_context::binding* variable_context::find(const std::string& name) const {
        for (const variable_context* scope = this; scope != nullptr; scope = scope->m_parent) {
            if (auto it = scope->m_bindings.find(name); it != scope->m_bindings.end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    bool variable_context::contains(const std::string& name) const {
        return find(name) != nullptr;
    }

    bool variable_context::assign(const std::string& name, binding value, bool overwrite) {
        if (!overwrite && contains(name)) {
            return false;
        }
        m_bindings.insert_or_assign(name, std::move(value));
        return true;
    }
}
