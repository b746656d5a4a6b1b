//
// Wildcard files on disk
//

#include <promptgen/wildcard_resolver.hh>

#include <fkYAML/node.hpp>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace promptgen {

namespace {
    constexpr const char* WILDCARD_EXTENSION = ".txt";

    // Helper: One candidate per non-empty line; `#` lines are comments
    void read_candidates(const fs::path& file, std::vector<std::string>& out) {
        std::ifstream in(file);
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            const auto first = line.find_first_not_of(" \t");
            if (first == std::string::npos || line[first] == '#') {
                continue;
            }
            const auto last = line.find_last_not_of(" \t");
            out.push_back(line.substr(first, last - first + 1));
        }
    }

    std::vector<std::string> read_candidates(const fs::path& file) {
        std::vector<std::string> out;
        read_candidates(file, out);
        return out;
    }

    // Helper: "colors/warm.txt" under `root` -> "colors/warm"
    std::string wildcard_name_of(const fs::path& root, const fs::path& file) {
        fs::path rel = fs::relative(file, root);
        rel.replace_extension();
        return rel.generic_string();
    }

    bool is_structured_file(const fs::path& file) {
        const auto ext = file.extension();
        return ext == ".yaml" || ext == ".yml";
    }

    std::string join_name(const std::string& prefix, const std::string& key) {
        return prefix.empty() ? key : prefix + "/" + key;
    }

    // Helper: Scalar node as candidate text; null and nested nodes yield nothing
    bool scalar_text(const fkyaml::node& node, std::string& out) {
        if (node.is_string()) {
            out = node.get_value<std::string>();
            return true;
        }
        if (node.is_integer()) {
            out = std::to_string(node.get_value<std::int64_t>());
            return true;
        }
        if (node.is_float_number()) {
            std::ostringstream oss;
            oss << node.get_value<double>();
            out = oss.str();
            return true;
        }
        if (node.is_boolean()) {
            out = node.get_value<bool>() ? "true" : "false";
            return true;
        }
        return false;
    }

    void flatten_yaml(const fkyaml::node& node, const std::string& name,
                      std::map<std::string, std::vector<std::string>>& out) {
        if (node.is_mapping()) {
            for (auto it = node.begin(); it != node.end(); ++it) {
                flatten_yaml(*it, join_name(name, it.key().get_value<std::string>()), out);
            }
            return;
        }

        std::string text;
        if (node.is_sequence()) {
            auto& values = out[name];
            for (std::size_t i = 0; i < node.size(); ++i) {
                if (scalar_text(node[i], text)) {
                    values.push_back(text);
                }
            }
        } else if (!name.empty() && scalar_text(node, text)) {
            out[name].push_back(text);
        }
    }

    std::map<std::string, std::vector<std::string>> load_structured(const fs::path& search_dir) {
        std::map<std::string, std::vector<std::string>> wildcards;

        std::error_code ec;
        if (!fs::is_directory(search_dir, ec)) {
            return wildcards;
        }

        // Sorted so that overlapping keys merge in a stable order
        std::vector<fs::path> files;
        for (const auto& entry : fs::recursive_directory_iterator(search_dir)) {
            if (entry.is_regular_file() && is_structured_file(entry.path())) {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());

        for (const auto& file : files) {
            std::ifstream in(file);
            if (!in.is_open()) {
                throw std::runtime_error("Failed to open wildcard file: " + file.string());
            }

            fkyaml::node root;
            try {
                root = fkyaml::node::deserialize(in);
            } catch (const std::exception& e) {
                throw std::runtime_error("Failed to parse YAML wildcard file " + file.string() + ": " + e.what());
            }

            std::string prefix = fs::relative(file.parent_path(), search_dir).generic_string();
            if (prefix == ".") {
                prefix.clear();
            }
            flatten_yaml(root, prefix, wildcards);
        }
        return wildcards;
    }
}

directory_wildcard_resolver::directory_wildcard_resolver(std::vector<fs::path> search_paths)
    : m_search_paths(std::move(search_paths)) {
    m_structured.reserve(m_search_paths.size());
    for (const auto& search_dir : m_search_paths) {
        m_structured.push_back(load_structured(search_dir));
    }
}

std::vector<std::string> directory_wildcard_resolver::resolve(const std::string& name) const {
    if (name.find('*') == std::string::npos) {
        for (std::size_t i = 0; i < m_search_paths.size(); ++i) {
            fs::path candidate = m_search_paths[i] / (name + WILDCARD_EXTENSION);
            std::error_code ec;
            if (fs::is_regular_file(candidate, ec)) {
                return read_candidates(candidate);
            }
            if (auto it = m_structured[i].find(name); it != m_structured[i].end()) {
                return it->second;
            }
        }
        return {};
    }

    // Glob: collect every matching wildcard, earlier search paths shadow later ones
    std::map<std::string, std::vector<std::string>> matches;
    for (std::size_t i = 0; i < m_search_paths.size(); ++i) {
        const auto& search_dir = m_search_paths[i];
        std::error_code ec;
        if (!fs::is_directory(search_dir, ec)) {
            continue;
        }
        for (const auto& entry : fs::recursive_directory_iterator(search_dir)) {
            if (!entry.is_regular_file() || entry.path().extension() != WILDCARD_EXTENSION) {
                continue;
            }
            std::string wildcard = wildcard_name_of(search_dir, entry.path());
            if (wildcard_name_matches(name, wildcard) && matches.find(wildcard) == matches.end()) {
                matches.emplace(std::move(wildcard), read_candidates(entry.path()));
            }
        }
        for (const auto& [wildcard, values] : m_structured[i]) {
            if (wildcard_name_matches(name, wildcard)) {
                matches.emplace(wildcard, values);
            }
        }
    }

    std::vector<std::string> results;
    for (const auto& [wildcard, values] : matches) {
        results.insert(results.end(), values.begin(), values.end());
    }
    return results;
}

} // namespace promptgen
