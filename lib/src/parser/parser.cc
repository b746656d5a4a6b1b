/*
 * Prompt template parser - recursive descent over the configurable grammar
 */

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <optional>
#include <regex>
#include <sstream>

#include <promptgen/parser.hh>
#include <promptgen/command.hh>
#include <promptgen/errors.hh>

#include "parser/parse_state.h"
#include "parser/parser_constants.h"

namespace promptgen {
    namespace parser_detail {
        source_location locate(std::string_view text, std::size_t offset) {
            source_location loc{1, 1};
            const std::size_t stop = std::min(offset, text.size());
            for (std::size_t i = 0; i < stop; ++i) {
                if (text[i] == '\n') {
                    ++loc.line;
                    loc.column = 1;
                } else {
                    ++loc.column;
                }
            }
            return loc;
        }
    }

    using namespace parser_detail;

    namespace {
        bool is_space(char ch) {
            return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
        }

        bool is_digit(char ch) {
            return ch >= '0' && ch <= '9';
        }

        std::string_view trim(std::string_view text) {
            while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
            while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
            return text;
        }

        bool is_alnum_only(std::string_view text) {
            return !text.empty() && std::all_of(text.begin(), text.end(), [](char ch) {
                return std::isalnum(static_cast<unsigned char>(ch)) != 0;
            });
        }

        // Anything a float conversion would accept: [sign] digits [. digits] [exp], inf, nan
        bool looks_like_real(std::string_view text) {
            text = trim(text);
            if (text.empty()) {
                return false;
            }
            std::size_t i = 0;
            if (text[i] == '+' || text[i] == '-') {
                ++i;
            }
            std::string rest;
            for (std::size_t j = i; j < text.size(); ++j) {
                rest += static_cast<char>(std::tolower(static_cast<unsigned char>(text[j])));
            }
            if (rest == "inf" || rest == "infinity" || rest == "nan") {
                return true;
            }

            bool digits = false;
            while (i < text.size() && is_digit(text[i])) { ++i; digits = true; }
            if (i < text.size() && text[i] == '.') {
                ++i;
                while (i < text.size() && is_digit(text[i])) { ++i; digits = true; }
            }
            if (!digits) {
                return false;
            }
            if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
                ++i;
                if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
                    ++i;
                }
                bool exp_digits = false;
                while (i < text.size() && is_digit(text[i])) { ++i; exp_digits = true; }
                if (!exp_digits) {
                    return false;
                }
            }
            return i == text.size();
        }

        std::string describe_expected(const std::vector<std::string>& expected) {
            if (expected.empty()) {
                return "text or directive";
            }
            std::string out;
            for (std::size_t i = 0; i < expected.size(); ++i) {
                if (i > 0) {
                    out += (i + 1 == expected.size()) ? " or " : ", ";
                }
                out += expected[i];
            }
            return out;
        }

        [[noreturn]] void throw_syntax_error(const parse_state& state, std::size_t offset, const std::string& expected) {
            const auto loc = locate(state.input, offset);
            std::ostringstream msg;
            msg << "Syntax error at line " << loc.line << ", column " << loc.column
                << ": expected " << expected;
            if (offset < state.input.size()) {
                msg << ", found '" << state.input[offset] << "'";
            } else {
                msg << ", found end of input";
            }
            throw syntax_error(msg.str(), offset, loc.line, loc.column, expected);
        }

        enum class scope {
            top,    // prompt
            block,  // inside a directive that closes with `closer`
            path    // wildcard name
        };

        struct frame {
            scope kind;
            const std::string* closer;
        };

        struct bound_clause {
            std::size_t offset;
            std::optional<std::size_t> lower;
            std::optional<std::size_t> upper;
            std::string separator{DEFAULT_SEPARATOR};
        };

        struct arm_head {
            std::size_t offset;
            std::optional<std::string> context_key;
            std::string pattern;
        };

        class grammar {
            public:
                grammar(const parser& owner, parse_state& state)
                    : m_owner(owner), m_config(owner.config()), m_state(state) {
                }

                command parse_document() {
                    const frame top{scope::top, nullptr};
                    auto items = parse_items(top);
                    if (!m_state.at_end()) {
                        if (m_state.error_pos >= m_state.cursor) {
                            throw_syntax_error(m_state, m_state.error_pos, describe_expected(m_state.expected));
                        }
                        throw_syntax_error(m_state, m_state.cursor, "text or directive");
                    }
                    return make_sequence(std::move(items));
                }

            private:
                const parser& m_owner;
                const grammar_config& m_config;
                parse_state& m_state;

                class depth_guard {
                    public:
                        explicit depth_guard(parse_state& state) : m_state(state) {
                            if (++m_state.depth > MAX_NESTING_DEPTH) {
                                --m_state.depth;
                                throw_syntax_error(m_state, m_state.cursor,
                                                   "at most " + std::to_string(MAX_NESTING_DEPTH) + " nested directives");
                            }
                        }
                        ~depth_guard() { --m_state.depth; }

                        depth_guard(const depth_guard&) = delete;
                        depth_guard& operator =(const depth_guard&) = delete;

                    private:
                        parse_state& m_state;
                };

                // ----------------------------------------------------------
                // Lexical helpers
                // ----------------------------------------------------------

                void skip_ws() {
                    while (!m_state.at_end() && is_space(m_state.peek())) {
                        ++m_state.cursor;
                    }
                }

                void skip_to_line_end() {
                    while (!m_state.at_end() && m_state.peek() != '\n') {
                        ++m_state.cursor;
                    }
                }

                // `#...`, `//...` and `/*...*/`, only ever at chunk boundaries
                bool skip_comments() {
                    bool skipped = false;
                    while (!m_state.at_end()) {
                        if (m_state.peek() == LINE_COMMENT || m_state.starts_with(LINE_COMMENT_CXX)) {
                            skip_to_line_end();
                            m_state.consume('\n');
                            skipped = true;
                            continue;
                        }
                        if (m_state.starts_with(BLOCK_COMMENT_OPEN)) {
                            const auto close = m_state.input.find(BLOCK_COMMENT_CLOSE, m_state.cursor + BLOCK_COMMENT_OPEN.size());
                            if (close == std::string_view::npos || close + BLOCK_COMMENT_CLOSE.size() > m_state.limit) {
                                break;
                            }
                            m_state.cursor = close + BLOCK_COMMENT_CLOSE.size();
                            skipped = true;
                            continue;
                        }
                        break;
                    }
                    return skipped;
                }

                std::optional<std::string> read_name() {
                    const std::size_t start = m_state.cursor;
                    auto head = [](char ch) {
                        return std::isalpha(static_cast<unsigned char>(ch)) || ch == '_' || ch == '-';
                    };
                    auto tail = [](char ch) {
                        return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_' || ch == '-';
                    };
                    if (m_state.at_end() || !head(m_state.peek())) {
                        m_state.fail("variable name");
                        return std::nullopt;
                    }
                    ++m_state.cursor;
                    while (!m_state.at_end() && tail(m_state.peek())) {
                        ++m_state.cursor;
                    }
                    return std::string(m_state.slice(start, m_state.cursor));
                }

                std::optional<std::size_t> read_integer() {
                    const std::size_t start = m_state.cursor;
                    while (!m_state.at_end() && is_digit(m_state.peek())) {
                        ++m_state.cursor;
                    }
                    if (start == m_state.cursor) {
                        return std::nullopt;
                    }
                    std::size_t value = 0;
                    const auto digits = m_state.slice(start, m_state.cursor);
                    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
                    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
                        throw_syntax_error(m_state, start, "an integer bound that fits in size_t");
                    }
                    return value;
                }

                // [0-9.]+ converted as a whole; restores the cursor on failure
                std::optional<double> read_real() {
                    const std::size_t start = m_state.cursor;
                    while (!m_state.at_end() && (is_digit(m_state.peek()) || m_state.peek() == '.')) {
                        ++m_state.cursor;
                    }
                    const auto text = m_state.slice(start, m_state.cursor);
                    double value = 0.0;
                    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
                    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size() || !std::isfinite(value)) {
                        m_state.cursor = start;
                        return std::nullopt;
                    }
                    return value;
                }

                std::optional<sampling_method> read_sampler() {
                    if (m_state.at_end()) {
                        return std::nullopt;
                    }
                    auto method = sampling_method_from_symbol(m_state.peek());
                    if (method) {
                        ++m_state.cursor;
                    }
                    return method;
                }

                bool expect(std::string_view token, const std::string& description) {
                    if (m_state.consume(token)) {
                        return true;
                    }
                    m_state.fail(description);
                    return false;
                }

                // ----------------------------------------------------------
                // Sequences and literals
                // ----------------------------------------------------------

                bool group_allowed(const frame& f, directive_group group) const {
                    if (f.kind == scope::path) {
                        return group == directive_group::block || group == directive_group::variable;
                    }
                    return true;
                }

                bool at_literal_stop(const frame& f) const {
                    if (m_state.peek() == LINE_COMMENT) {
                        return true;
                    }
                    for (auto group : m_owner.group_order()) {
                        if (m_state.starts_with(m_owner.delimiter(group))) {
                            return true;
                        }
                    }
                    switch (f.kind) {
                        case scope::top:
                            return false;
                        case scope::block:
                            return m_state.starts_with(OPTION_SEPARATOR) ||
                                   m_state.starts_with(BOUND_DELIMITER) ||
                                   m_state.starts_with(WEIGHT_DELIMITER) ||
                                   m_state.starts_with(*f.closer);
                        case scope::path:
                            return m_state.peek() == VARIABLE_SPEC_OPEN ||
                                   m_state.peek() == VARIABLE_SPEC_CLOSE ||
                                   m_state.starts_with(m_config.variant_end);
                    }
                    return true;
                }

                std::optional<command> parse_literal(const frame& f) {
                    const std::size_t start = m_state.cursor;
                    while (!m_state.at_end() && !at_literal_stop(f)) {
                        ++m_state.cursor;
                    }
                    if (start == m_state.cursor) {
                        return std::nullopt;
                    }
                    return make_literal(std::string(m_state.slice(start, m_state.cursor)));
                }

                std::optional<command> parse_chunk(const frame& f) {
                    for (auto group : m_owner.group_order()) {
                        if (!group_allowed(f, group) || !m_state.starts_with(m_owner.delimiter(group))) {
                            continue;
                        }
                        std::optional<command> cmd;
                        switch (group) {
                            case directive_group::block:
                                cmd = try_block();
                                break;
                            case directive_group::variable:
                                cmd = (f.kind == scope::path) ? try_access(true) : try_variable();
                                break;
                            case directive_group::wrap:
                                cmd = try_wrap();
                                break;
                            case directive_group::wildcard:
                                cmd = try_wildcard();
                                break;
                        }
                        if (cmd) {
                            return cmd;
                        }
                    }
                    return parse_literal(f);
                }

                std::vector<command> parse_items(const frame& f) {
                    std::vector<command> items;
                    bool comment_gap = false;
                    while (!m_state.at_end()) {
                        if (skip_comments()) {
                            comment_gap = true;
                            continue;
                        }
                        auto chunk = parse_chunk(f);
                        if (!chunk) {
                            break;
                        }
                        // Literal fragments split by a stripped comment join with one space
                        if (comment_gap && !items.empty() && is_literal(items.back()) && is_literal(*chunk)) {
                            auto& previous = std::get<literal_command>(items.back().node).text;
                            const auto& next = *literal_text(*chunk);
                            const bool spaced = (!previous.empty() && is_space(previous.back())) ||
                                                (!next.empty() && is_space(next.front()));
                            if (!spaced) {
                                previous += ' ';
                            }
                            previous += next;
                        } else {
                            items.push_back(std::move(*chunk));
                        }
                        comment_gap = false;
                    }
                    return items;
                }

                // Whitespace before the closing punctuation of a directive is not content
                static void trim_trailing_space(std::vector<command>& items) {
                    if (items.empty() || !is_literal(items.back())) {
                        return;
                    }
                    auto& text = std::get<literal_command>(items.back().node).text;
                    while (!text.empty() && is_space(text.back())) {
                        text.pop_back();
                    }
                    if (text.empty()) {
                        items.pop_back();
                    }
                }

                command parse_block_value(const std::string& closer) {
                    skip_ws();
                    const frame f{scope::block, &closer};
                    auto items = parse_items(f);
                    trim_trailing_space(items);
                    return make_sequence(std::move(items));
                }

                // ----------------------------------------------------------
                // Blocks sharing variant_start: the priority order
                // comment, probability, condition, variant is part of the
                // language; changing it changes which programs are accepted.
                // ----------------------------------------------------------

                std::optional<command> try_block() {
                    depth_guard guard(m_state);
                    if (auto cmd = try_comment()) return cmd;
                    if (auto cmd = try_probability()) return cmd;
                    if (auto cmd = try_condition()) return cmd;
                    return try_variant();
                }

                std::optional<command> try_comment() {
                    const std::size_t mark = m_state.cursor;
                    m_state.consume(m_config.variant_start);
                    skip_ws();
                    if (!m_state.consume(COMMENT_BLOCK_MARKER)) {
                        m_state.cursor = mark;
                        return std::nullopt;
                    }
                    const std::size_t text_start = m_state.cursor;
                    while (!m_state.at_end() && m_state.peek() != COMMENT_BLOCK_MARKER) {
                        if (m_state.starts_with(m_config.variant_start) || m_state.starts_with(m_config.variant_end)) {
                            break;
                        }
                        ++m_state.cursor;
                    }
                    std::string text(m_state.slice(text_start, m_state.cursor));
                    if (!expect(std::string_view(&COMMENT_BLOCK_MARKER, 1), "'*'")) {
                        m_state.cursor = mark;
                        return std::nullopt;
                    }
                    skip_ws();
                    if (!expect(m_config.variant_end, "'" + m_config.variant_end + "'")) {
                        m_state.cursor = mark;
                        return std::nullopt;
                    }
                    return make_comment(std::move(text));
                }

                std::optional<command> try_probability() {
                    const std::size_t mark = m_state.cursor;
                    m_state.consume(m_config.variant_start);
                    skip_ws();
                    auto method = read_sampler();
                    auto chance = read_real();
                    if (!chance || *chance < 0.0 || *chance > 1.0) {
                        m_state.cursor = mark;
                        return std::nullopt;
                    }
                    if (!expect(WEIGHT_DELIMITER, "'::'")) {
                        m_state.cursor = mark;
                        return std::nullopt;
                    }
                    auto value = parse_block_value(m_config.variant_end);
                    skip_ws();
                    if (!expect(m_config.variant_end, "'" + m_config.variant_end + "'")) {
                        m_state.cursor = mark;
                        return std::nullopt;
                    }
                    return make_probability(*chance, std::move(value), method);
                }

                // pattern "::" - with an optional ${name} prefix selecting the tested variable
                std::optional<arm_head> read_arm_head() {
                    const std::size_t mark = m_state.cursor;
                    arm_head head{mark, std::nullopt, {}};

                    if (m_state.starts_with(m_config.variable_start)) {
                        m_state.consume(m_config.variable_start);
                        skip_ws();
                        auto name = read_name();
                        skip_ws();
                        if (!name || !m_state.consume(m_config.variable_end)) {
                            m_state.cursor = mark;
                            return std::nullopt;
                        }
                        head.context_key = std::move(name);
                    }

                    const std::size_t pattern_start = m_state.cursor;
                    while (!m_state.at_end() && !m_state.starts_with(WEIGHT_DELIMITER)) {
                        if (m_state.starts_with(m_config.variant_start) || m_state.starts_with(m_config.variant_end) ||
                            m_state.starts_with(OPTION_SEPARATOR)) {
                            m_state.cursor = mark;
                            return std::nullopt;
                        }
                        ++m_state.cursor;
                    }
                    if (m_state.at_end()) {
                        m_state.cursor = mark;
                        return std::nullopt;
                    }

                    const auto pattern = trim(m_state.slice(pattern_start, m_state.cursor));
                    if (!head.context_key && looks_like_real(pattern)) {
                        // Reserved for probability blocks (and weights)
                        m_state.cursor = pattern_start;
                        m_state.fail("non-numeric condition");
                        m_state.cursor = mark;
                        return std::nullopt;
                    }
                    head.offset = pattern_start;
                    head.pattern = std::string(pattern);
                    m_state.consume(WEIGHT_DELIMITER);
                    return head;
                }

                condition_arm build_arm(arm_head head, command value) {
                    try {
                        return make_condition_arm(std::move(head.pattern), std::move(value), std::move(head.context_key));
                    } catch (const std::regex_error&) {
                        throw_syntax_error(m_state, head.offset, "a valid regular expression");
                    }
                }

                std::optional<command> try_condition() {
                    const std::size_t mark = m_state.cursor;
                    m_state.consume(m_config.variant_start);

                    auto first = read_arm_head();
                    if (!first) {
                        m_state.cursor = mark;
                        return std::nullopt;
                    }

                    std::vector<condition_arm> arms;
                    auto first_value = parse_block_value(m_config.variant_end);
                    arms.push_back(build_arm(std::move(*first), std::move(first_value)));

                    command else_value = make_literal("");
                    while (true) {
                        skip_ws();
                        if (!m_state.consume(OPTION_SEPARATOR)) {
                            break;
                        }
                        const std::size_t arm_mark = m_state.cursor;
                        skip_ws();
                        if (auto head = read_arm_head()) {
                            auto value = parse_block_value(m_config.variant_end);
                            arms.push_back(build_arm(std::move(*head), std::move(value)));
                            continue;
                        }
                        m_state.cursor = arm_mark;
                        else_value = parse_block_value(m_config.variant_end);
                        skip_ws();
                        break;
                    }

                    if (!expect(m_config.variant_end, "'" + m_config.variant_end + "'")) {
                        m_state.cursor = mark;
                        return std::nullopt;
                    }
                    return make_condition(std::move(arms), std::move(else_value));
                }

                // N$$ | N-M$$ | N-$$ | -M$$, then an optional separator$$
                std::optional<bound_clause> read_bound() {
                    const std::size_t mark = m_state.cursor;
                    bound_clause bound{mark, std::nullopt, std::nullopt};

                    auto lower = read_integer();
                    if (m_state.consume('-')) {
                        auto upper = read_integer();
                        if (!lower && !upper) {
                            m_state.cursor = mark;
                            return std::nullopt;
                        }
                        bound.lower = lower;
                        bound.upper = upper;
                    } else if (lower) {
                        bound.lower = lower;
                        bound.upper = lower;
                    } else {
                        m_state.cursor = mark;
                        return std::nullopt;
                    }

                    if (!m_state.consume(BOUND_DELIMITER)) {
                        m_state.cursor = mark;
                        return std::nullopt;
                    }

                    const std::size_t separator_start = m_state.cursor;
                    while (!m_state.at_end()) {
                        const char ch = m_state.peek();
                        if (ch == '$' || ch == '{' || ch == '}') {
                            break;
                        }
                        ++m_state.cursor;
                    }
                    if (m_state.cursor > separator_start && m_state.starts_with(BOUND_DELIMITER)) {
                        // Padding around the separator is dropped unless it is all whitespace
                        const auto raw = m_state.slice(separator_start, m_state.cursor);
                        const auto trimmed = trim(raw);
                        bound.separator = std::string(trimmed.empty() ? raw : trimmed);
                        m_state.consume(BOUND_DELIMITER);
                    } else {
                        m_state.cursor = separator_start;
                    }
                    return bound;
                }

                std::optional<double> read_weight() {
                    const std::size_t mark = m_state.cursor;
                    auto weight = read_real();
                    if (weight && m_state.consume(WEIGHT_DELIMITER)) {
                        return weight;
                    }
                    m_state.cursor = mark;
                    return std::nullopt;
                }

                std::optional<command> try_variant() {
                    const std::size_t mark = m_state.cursor;
                    m_state.consume(m_config.variant_start);
                    skip_ws();
                    auto method = read_sampler();
                    auto bound = read_bound();
                    skip_ws();

                    std::vector<variant_option> options;
                    while (true) {
                        skip_ws();
                        const double weight = read_weight().value_or(1.0);
                        auto value = parse_block_value(m_config.variant_end);
                        options.push_back(make_option(std::move(value), weight));
                        skip_ws();
                        if (!m_state.consume(OPTION_SEPARATOR)) {
                            break;
                        }
                    }

                    if (!m_state.consume(m_config.variant_end)) {
                        m_state.fail("'|'");
                        m_state.fail("'" + m_config.variant_end + "'");
                        m_state.cursor = mark;
                        return std::nullopt;
                    }

                    std::size_t lower = 1;
                    std::size_t upper = 1;
                    std::string separator{DEFAULT_SEPARATOR};
                    if (bound) {
                        lower = bound->lower.value_or(1);
                        upper = bound->upper.value_or(options.size());
                        separator = std::move(bound->separator);
                        if (lower > upper) {
                            const auto loc = locate(m_state.input, bound->offset);
                            throw invalid_bound_error(
                                "Invalid variant bound at line " + std::to_string(loc.line) +
                                ", column " + std::to_string(loc.column) + ": lower bound " +
                                std::to_string(lower) + " exceeds upper bound " + std::to_string(upper),
                                bound->offset, loc.line, loc.column, lower, upper);
                        }
                    }
                    return make_variant(std::move(options), lower, upper, std::move(separator), method);
                }

                // ----------------------------------------------------------
                // Variables
                // ----------------------------------------------------------

                std::optional<command> try_variable() {
                    depth_guard guard(m_state);
                    if (auto cmd = try_assignment()) {
                        return cmd;
                    }
                    return try_access(false);
                }

                std::optional<command> try_assignment() {
                    const std::size_t mark = m_state.cursor;
                    m_state.consume(m_config.variable_start);
                    skip_ws();
                    auto name = read_name();
                    if (!name) {
                        m_state.cursor = mark;
                        return std::nullopt;
                    }
                    skip_ws();
                    const bool preserve = m_state.consume(PRESERVE_EXISTING);
                    if (!m_state.consume(ASSIGN)) {
                        m_state.cursor = mark;
                        return std::nullopt;
                    }
                    const bool immediate = m_state.consume(EVALUATE_IMMEDIATELY);
                    auto value = parse_block_value(m_config.variable_end);
                    skip_ws();
                    if (!expect(m_config.variable_end, "'" + m_config.variable_end + "'")) {
                        m_state.cursor = mark;
                        return std::nullopt;
                    }
                    return make_variable_assignment(std::move(*name), std::move(value), !preserve, immediate);
                }

                std::optional<command> try_access(bool in_path) {
                    const std::size_t mark = m_state.cursor;
                    m_state.consume(m_config.variable_start);
                    skip_ws();
                    auto name = read_name();
                    if (!name) {
                        m_state.cursor = mark;
                        return std::nullopt;
                    }
                    skip_ws();

                    std::unique_ptr<command> fallback;
                    if (m_state.consume(DEFAULT_VALUE)) {
                        fallback = std::make_unique<command>(parse_block_value(m_config.variable_end));
                    }
                    skip_ws();
                    if (!expect(m_config.variable_end, "'" + m_config.variable_end + "'")) {
                        m_state.cursor = mark;
                        return std::nullopt;
                    }

                    // In a wildcard path an unbound variable falls back to its own name
                    if (in_path) {
                        if (!fallback) {
                            fallback = std::make_unique<command>(make_literal(*name));
                        } else if (const auto* text = literal_text(*fallback)) {
                            *fallback = make_literal(std::string(trim(*text)));
                        }
                    }
                    return make_variable_access(std::move(*name), std::move(fallback));
                }

                // ----------------------------------------------------------
                // Wrap and wildcard
                // ----------------------------------------------------------

                std::optional<command> try_wrap() {
                    depth_guard guard(m_state);
                    const std::size_t mark = m_state.cursor;
                    m_state.consume(m_config.wrap_start);
                    auto wrapper = parse_block_value(m_config.wrap_end);
                    skip_ws();
                    if (!expect(BOUND_DELIMITER, "'$$'")) {
                        m_state.cursor = mark;
                        return std::nullopt;
                    }
                    auto inner = parse_block_value(m_config.wrap_end);
                    skip_ws();
                    if (!expect(m_config.wrap_end, "'" + m_config.wrap_end + "'")) {
                        m_state.cursor = mark;
                        return std::nullopt;
                    }
                    return make_wrap(std::move(wrapper), std::move(inner));
                }

                std::map<std::string, std::unique_ptr<command>> parse_variable_spec(std::size_t begin, std::size_t end) {
                    std::map<std::string, std::unique_ptr<command>> variables;
                    std::size_t pair_start = begin;
                    while (pair_start <= end) {
                        std::size_t pair_end = m_state.input.find(VARIABLE_SPEC_SEPARATOR, pair_start);
                        if (pair_end == std::string_view::npos || pair_end > end) {
                            pair_end = end;
                        }

                        const auto pair = m_state.slice(pair_start, pair_end);
                        const auto eq = pair.find(ASSIGN);
                        const auto key = trim(pair.substr(0, eq));
                        if (!key.empty()) {
                            std::size_t value_begin = (eq == std::string_view::npos) ? pair_end : pair_start + eq + 1;
                            std::size_t value_end = pair_end;
                            while (value_begin < value_end && is_space(m_state.input[value_begin])) ++value_begin;
                            while (value_end > value_begin && is_space(m_state.input[value_end - 1])) --value_end;

                            const auto text = m_state.slice(value_begin, value_end);
                            command value = text.empty() || (m_owner.alnum_is_literal() && is_alnum_only(text))
                                ? make_literal(std::string(text))
                                : parse_region(value_begin, value_end);
                            variables[std::string(key)] = std::make_unique<command>(std::move(value));
                        }
                        pair_start = pair_end + 1;
                    }
                    return variables;
                }

                command parse_region(std::size_t begin, std::size_t end) {
                    parse_state nested(m_state.input, begin, end);
                    nested.depth = m_state.depth;
                    grammar sub(m_owner, nested);
                    return sub.parse_document();
                }

                std::optional<command> try_wildcard() {
                    depth_guard guard(m_state);
                    const std::size_t mark = m_state.cursor;
                    m_state.consume(m_config.wildcard_wrap);
                    auto method = read_sampler();

                    const frame path_frame{scope::path, nullptr};
                    auto path = parse_items(path_frame);
                    if (path.empty()) {
                        m_state.fail("wildcard name");
                        m_state.cursor = mark;
                        return std::nullopt;
                    }

                    std::map<std::string, std::unique_ptr<command>> variables;
                    const std::size_t spec_mark = m_state.cursor;
                    skip_ws();
                    if (m_state.consume(VARIABLE_SPEC_OPEN)) {
                        const std::size_t spec_start = m_state.cursor;
                        while (!m_state.at_end() && m_state.peek() != VARIABLE_SPEC_CLOSE) {
                            ++m_state.cursor;
                        }
                        const std::size_t spec_end = m_state.cursor;
                        if (spec_end == spec_start || !expect(std::string_view(&VARIABLE_SPEC_CLOSE, 1), "')'")) {
                            m_state.cursor = mark;
                            return std::nullopt;
                        }
                        variables = parse_variable_spec(spec_start, spec_end);
                    } else {
                        m_state.cursor = spec_mark;
                    }

                    if (!expect(m_config.wildcard_wrap, "closing '" + m_config.wildcard_wrap + "'")) {
                        m_state.cursor = mark;
                        return std::nullopt;
                    }
                    return make_wildcard(make_sequence(std::move(path)), method, std::move(variables));
                }
        };
    } // anonymous namespace

    /* parser */

    parser::parser(grammar_config config)
        : m_config(std::move(config)) {
        m_config.validate();

        m_group_order = {
            directive_group::block,
            directive_group::variable,
            directive_group::wrap,
            directive_group::wildcard
        };
        // A delimiter that is a prefix of another must be tried after it
        std::stable_sort(m_group_order.begin(), m_group_order.end(),
            [this](directive_group a, directive_group b) {
                return delimiter(a).size() > delimiter(b).size();
            });

        for (directive_group group : m_group_order) {
            const auto& start = delimiter(group);
            if (std::any_of(start.begin(), start.end(), [](char ch) {
                    return std::isalnum(static_cast<unsigned char>(ch)) != 0;
                })) {
                m_alnum_is_literal = false;
            }
        }
    }

    const std::string& parser::delimiter(directive_group group) const {
        switch (group) {
            case directive_group::block: return m_config.variant_start;
            case directive_group::variable: return m_config.variable_start;
            case directive_group::wrap: return m_config.wrap_start;
            case directive_group::wildcard: return m_config.wildcard_wrap;
        }
        return m_config.variant_start;
    }

    command parser::parse(std::string_view text) const {
        if (m_alnum_is_literal && is_alnum_only(text)) {
            return make_literal(std::string(text));
        }

        parse_state state(text, 0, text.size());
        grammar g(*this, state);
        return g.parse_document();
    }

    command parse(std::string_view text, const grammar_config& config) {
        return get_parser(config)->parse(text);
    }
} // namespace promptgen
