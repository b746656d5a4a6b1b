//
// Parse state - cursor over the template text plus the furthest failure seen
//

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace promptgen::parser_detail {

struct source_location {
    int line;
    int column;
};

source_location locate(std::string_view text, std::size_t offset);

struct parse_state {
    parse_state(std::string_view text, std::size_t begin, std::size_t end)
        : input(text), cursor(begin), limit(end), error_pos(begin) {
    }

    std::string_view input;   // Whole template, so offsets stay absolute
    std::size_t cursor;
    std::size_t limit;        // End of the region being parsed
    std::size_t depth = 0;

    /* Furthest failure, for error reporting after backtracking */
    std::size_t error_pos;
    std::vector<std::string> expected;

    [[nodiscard]] bool at_end() const { return cursor >= limit; }

    [[nodiscard]] char peek() const { return at_end() ? '\0' : input[cursor]; }

    [[nodiscard]] bool starts_with(std::string_view token) const {
        return !token.empty() && limit - cursor >= token.size() &&
               input.compare(cursor, token.size(), token) == 0;
    }

    bool consume(std::string_view token) {
        if (!starts_with(token)) {
            return false;
        }
        cursor += token.size();
        return true;
    }

    bool consume(char ch) {
        if (at_end() || input[cursor] != ch) {
            return false;
        }
        ++cursor;
        return true;
    }

    [[nodiscard]] std::string_view slice(std::size_t from, std::size_t to) const {
        return input.substr(from, to - from);
    }

    void fail(std::string what) {
        if (cursor > error_pos) {
            error_pos = cursor;
            expected.clear();
        }
        if (cursor == error_pos) {
            for (const auto& e : expected) {
                if (e == what) {
                    return;
                }
            }
            expected.push_back(std::move(what));
        }
    }
};

} // namespace promptgen::parser_detail
