//
// Generation engine
//

#include <promptgen/generator.hh>
#include <promptgen/errors.hh>

#include "generator/renderer.hh"

#include <sstream>
#include <unordered_set>

namespace promptgen {
    // ========================================================================
    // Error messages
    // ========================================================================

    std::string unresolved_wildcard_error::build_message(const std::string& wildcard) {
        std::ostringstream oss;
        oss << "Wildcard '" << wildcard << "' resolved to no values";
        return oss.str();
    }

    std::string recursion_limit_error::build_message(const std::string& what_was_expanded, std::size_t depth) {
        std::ostringstream oss;
        oss << "Expansion nested deeper than " << depth << " levels while expanding "
            << what_was_expanded << " (a wildcard or variable refers to itself)";
        return oss.str();
    }

    // ========================================================================
    // Policy names
    // ========================================================================

    const char* to_string(empty_wildcard_policy policy) {
        switch (policy) {
            case empty_wildcard_policy::error: return "error";
            case empty_wildcard_policy::empty: return "empty";
        }
        return "unknown";
    }

    std::optional<empty_wildcard_policy> empty_wildcard_policy_from_name(const std::string& name) {
        if (name == "error") return empty_wildcard_policy::error;
        if (name == "empty") return empty_wildcard_policy::empty;
        return std::nullopt;
    }

    // ========================================================================
    // Cyclical positions
    // ========================================================================

    std::size_t cyclical_state::advance(node_id id, std::size_t modulus) {
        auto& slot = m_positions[id];
        const std::size_t current = slot % modulus;
        slot = (current + 1) % modulus;
        return current;
    }

    std::size_t cyclical_state::position(node_id id) const {
        auto it = m_positions.find(id);
        return it != m_positions.end() ? it->second : 0;
    }

    // ========================================================================
    // Generator
    // ========================================================================

    generator::generator(const wildcard_resolver& resolver, generation_options options)
        : m_resolver(resolver),
          m_options(std::move(options)),
          m_parser(get_parser(m_options.config)) {
        seed_engine();
    }

    generator::~generator() = default;

    void generator::seed_engine() {
        if (m_options.seed) {
            m_rng.seed(*m_options.seed);
        } else {
            std::random_device device;
            m_rng.seed((static_cast<std::uint64_t>(device()) << 32) | device());
        }
    }

    void generator::reset() {
        m_cyclical.reset();
        m_sub_paths.clear();
        if (m_options.seed) {
            seed_engine();
        }
    }

    const command& generator::parsed(const std::string& text) {
        auto it = m_parsed.find(text);
        if (it == m_parsed.end()) {
            it = m_parsed.emplace(text, m_parser->parse(text)).first;
        }
        return it->second;
    }

    std::vector<std::string> generator::generate(const command& root, std::size_t count) {
        std::vector<std::string> results;

        if (m_options.method != sampling_method::combinatorial) {
            results.reserve(count);
            for (std::size_t i = 0; i < count; ++i) {
                renderer r(*this, m_options.method, nullptr);
                results.push_back(r.render_output(root));
                r.finish();
            }
            return results;
        }

        // Depth-first enumeration; stops early once the decision tree is exhausted
        choice_path path;
        std::unordered_set<std::string> seen;
        while (results.size() < count) {
            renderer r(*this, sampling_method::combinatorial, &path);
            std::string text = r.render_output(root);
            r.finish();

            if (seen.insert(text).second) {
                results.push_back(std::move(text));
            }
            if (!path.advance()) {
                break;
            }
        }
        return results;
    }

    std::vector<std::string> generator::generate(std::string_view text, std::size_t count) {
        return generate(parsed(std::string(text)), count);
    }

    // ========================================================================
    // One-shot helpers
    // ========================================================================

    std::vector<std::string> generate(const command& root, sampling_method method,
                                      const wildcard_resolver& resolver, std::size_t count) {
        generation_options options;
        options.method = method;
        generator engine(resolver, std::move(options));
        return engine.generate(root, count);
    }

    std::vector<std::string> generate(std::string_view text, sampling_method method,
                                      const wildcard_resolver& resolver, std::size_t count) {
        generation_options options;
        options.method = method;
        generator engine(resolver, std::move(options));
        return engine.generate(text, count);
    }
}
