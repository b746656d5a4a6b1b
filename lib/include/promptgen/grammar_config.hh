//
// Delimiter configuration of the prompt grammar.
//

#pragma once

#include <cstddef>
#include <string>

namespace promptgen {
    /**
     * The configurable punctuation of the template language.
     *
     * Every start delimiter is reserved: literal text stops wherever one of
     * them begins. The fixed punctuation (`|`, `$$`, `::`, the sampling
     * method symbols and the comment markers) is not configurable.
     *
     * Values compare by content, so two separately built configurations with
     * the same delimiters share one compiled parser (see get_parser()).
     */
    struct grammar_config {
        std::string variant_start = "{";
        std::string variant_end = "}";
        std::string wildcard_wrap = "__";
        std::string variable_start = "${";
        std::string variable_end = "}";
        std::string wrap_start = "%{";
        std::string wrap_end = "}";

        /// Throws configuration_error on empty or conflicting delimiters
        void validate() const;

        bool operator==(const grammar_config& other) const = default;
    };

    struct grammar_config_hash {
        std::size_t operator()(const grammar_config& config) const noexcept;
    };

    const grammar_config& default_grammar_config();
}
