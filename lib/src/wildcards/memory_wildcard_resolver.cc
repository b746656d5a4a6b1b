//
// In-memory wildcard resolver and name matching
//

#include <promptgen/wildcard_resolver.hh>

namespace promptgen {
    bool wildcard_name_matches(const std::string& pattern, const std::string& name) {
        // Greedy matcher with backtracking to the last `*`
        std::size_t p = 0;
        std::size_t n = 0;
        std::size_t star = std::string::npos;
        std::size_t resume = 0;

        while (n < name.size()) {
            if (p < pattern.size() && pattern[p] == '*') {
                star = p++;
                resume = n;
            } else if (p < pattern.size() && pattern[p] == name[n]) {
                ++p;
                ++n;
            } else if (star != std::string::npos) {
                p = star + 1;
                n = ++resume;
            } else {
                return false;
            }
        }
        while (p < pattern.size() && pattern[p] == '*') {
            ++p;
        }
        return p == pattern.size();
    }

    std::vector<std::string> null_wildcard_resolver::resolve(const std::string&) const {
        return {};
    }

    memory_wildcard_resolver::memory_wildcard_resolver(std::map<std::string, std::vector<std::string>> entries)
        : m_entries(std::move(entries)) {
    }

    void memory_wildcard_resolver::add(const std::string& name, std::vector<std::string> values) {
        auto& slot = m_entries[name];
        slot.insert(slot.end(), std::make_move_iterator(values.begin()), std::make_move_iterator(values.end()));
    }

    std::vector<std::string> memory_wildcard_resolver::resolve(const std::string& name) const {
        if (name.find('*') == std::string::npos) {
            auto it = m_entries.find(name);
            return it != m_entries.end() ? it->second : std::vector<std::string>{};
        }

        std::vector<std::string> merged;
        for (const auto& [entry_name, values] : m_entries) {
            if (wildcard_name_matches(name, entry_name)) {
                merged.insert(merged.end(), values.begin(), values.end());
            }
        }
        return merged;
    }
}
