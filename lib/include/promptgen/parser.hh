//
// Prompt template parser - C++ Interface
//

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "command.hh"
#include "errors.hh"
#include "grammar_config.hh"

namespace promptgen {
    // Directive families that open with a configurable delimiter.
    enum class directive_group {
        block,     // variant_start: comment, probability, condition, variant
        variable,  // variable_start: assignment, access
        wrap,      // wrap_start
        wildcard   // wildcard_wrap
    };

    /**
     * A parser compiled for one grammar configuration.
     *
     * Construction validates the configuration (configuration_error) and
     * precomputes the order in which directive groups are tried at each
     * position. parse() is const and may be called concurrently.
     */
    class parser {
        public:
            explicit parser(grammar_config config);

            parser(const parser&) = delete;
            parser& operator =(const parser&) = delete;

            // Throws syntax_error (or invalid_bound_error) when the whole text
            // does not match the grammar
            [[nodiscard]] command parse(std::string_view text) const;

            [[nodiscard]] const grammar_config& config() const { return m_config; }

            // Longest opening delimiter first, ties in declaration order
            [[nodiscard]] const std::vector<directive_group>& group_order() const { return m_group_order; }

            [[nodiscard]] const std::string& delimiter(directive_group group) const;

            // True when no opening delimiter contains a letter or digit, so
            // alphanumeric text can never start a directive
            [[nodiscard]] bool alnum_is_literal() const { return m_alnum_is_literal; }

        private:
            grammar_config m_config;
            std::vector<directive_group> m_group_order;
            bool m_alnum_is_literal = true;
    };

    // Configurations kept compiled at once by get_parser()
    inline constexpr std::size_t parser_cache_capacity = 32;

    // Memoized parser per distinct configuration value. Entries stay cached
    // after the returned handles are released; when the cache is full the
    // least recently requested configuration is evicted. The default
    // configuration is never evicted.
    std::shared_ptr<const parser> get_parser(const grammar_config& config);

    // Number of entries in the parser cache
    std::size_t parser_cache_size();

    command parse(std::string_view text, const grammar_config& config = default_grammar_config());
}
