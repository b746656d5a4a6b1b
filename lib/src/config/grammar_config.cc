//
// Grammar configuration validation
//

#include <promptgen/grammar_config.hh>
#include <promptgen/errors.hh>

#include <array>
#include <functional>
#include <utility>

namespace promptgen {
    namespace {
        // Fixed punctuation that no configurable delimiter may shadow
        constexpr std::array<const char*, 4> reserved_punctuation = {"|", "$$", "::", "#"};

        void hash_combine(std::size_t& seed, const std::string& value) {
            seed ^= std::hash<std::string>{}(value) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        }
    }

    void grammar_config::validate() const {
        const std::array<std::pair<const char*, const std::string*>, 7> all = {{
            {"variant_start", &variant_start},
            {"variant_end", &variant_end},
            {"wildcard_wrap", &wildcard_wrap},
            {"variable_start", &variable_start},
            {"variable_end", &variable_end},
            {"wrap_start", &wrap_start},
            {"wrap_end", &wrap_end},
        }};

        for (const auto& [name, value] : all) {
            if (value->empty()) {
                throw configuration_error(name, std::string("Delimiter '") + name + "' must not be empty");
            }
            for (char ch : *value) {
                if (ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r') {
                    throw configuration_error(name, std::string("Delimiter '") + name + "' must not contain whitespace");
                }
            }
            for (const char* reserved : reserved_punctuation) {
                if (*value == reserved) {
                    throw configuration_error(name,
                        std::string("Delimiter '") + name + "' conflicts with reserved punctuation '" +
                        reserved + "'");
                }
            }
        }

        // Opening delimiters decide which directive starts at a position, so they
        // must be pairwise distinct.
        const std::array<std::pair<const char*, const std::string*>, 4> starts = {{
            {"variant_start", &variant_start},
            {"variable_start", &variable_start},
            {"wrap_start", &wrap_start},
            {"wildcard_wrap", &wildcard_wrap},
        }};

        for (std::size_t i = 0; i < starts.size(); ++i) {
            for (std::size_t j = i + 1; j < starts.size(); ++j) {
                if (*starts[i].second == *starts[j].second) {
                    throw configuration_error(starts[j].first,
                        std::string("Delimiters '") + starts[i].first + "' and '" + starts[j].first +
                        "' are both '" + *starts[i].second + "'");
                }
            }
        }

        if (variant_end == variant_start) {
            throw configuration_error("variant_end", "Delimiter 'variant_end' must differ from 'variant_start'");
        }
    }

    std::size_t grammar_config_hash::operator()(const grammar_config& config) const noexcept {
        std::size_t seed = 0;
        hash_combine(seed, config.variant_start);
        hash_combine(seed, config.variant_end);
        hash_combine(seed, config.wildcard_wrap);
        hash_combine(seed, config.variable_start);
        hash_combine(seed, config.variable_end);
        hash_combine(seed, config.wrap_start);
        hash_combine(seed, config.wrap_end);
        return seed;
    }

    const grammar_config& default_grammar_config() {
        static const grammar_config config{};
        return config;
    }
}
