//
// Parser constants - fixed punctuation and limits of the prompt grammar
//

#ifndef PROMPTGEN_PARSER_CONSTANTS_H
#define PROMPTGEN_PARSER_CONSTANTS_H

#include <cstddef>
#include <string_view>

namespace promptgen::parser_detail {

/* Fixed punctuation */
constexpr std::string_view OPTION_SEPARATOR = "|";
constexpr std::string_view BOUND_DELIMITER = "$$";
constexpr std::string_view WEIGHT_DELIMITER = "::";
constexpr char COMMENT_BLOCK_MARKER = '*';
constexpr char LINE_COMMENT = '#';
constexpr std::string_view LINE_COMMENT_CXX = "//";
constexpr std::string_view BLOCK_COMMENT_OPEN = "/*";
constexpr std::string_view BLOCK_COMMENT_CLOSE = "*/";
constexpr char PRESERVE_EXISTING = '?';
constexpr char ASSIGN = '=';
constexpr char EVALUATE_IMMEDIATELY = '!';
constexpr char DEFAULT_VALUE = ':';
constexpr char VARIABLE_SPEC_OPEN = '(';
constexpr char VARIABLE_SPEC_CLOSE = ')';
constexpr char VARIABLE_SPEC_SEPARATOR = ',';

/* Default separator between selected variant options */
constexpr std::string_view DEFAULT_SEPARATOR = ",";

/* Parser limits (prevent runaway recursion on hostile input) */
constexpr std::size_t MAX_NESTING_DEPTH = 256;

} // namespace promptgen::parser_detail

#endif // PROMPTGEN_PARSER_CONSTANTS_H
