//
// Exception types raised by the parser, the grammar configuration and the
// generation engine.
//

#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace promptgen {
    class syntax_error : public std::runtime_error {
        public:
            syntax_error(const std::string& msg, std::size_t offset, int line, int column,
                         std::string expected)
                : std::runtime_error(msg),
                  offset_(offset),
                  line_(line),
                  column_(column),
                  expected_(std::move(expected)) {
            }

            [[nodiscard]] std::size_t offset() const { return offset_; }
            [[nodiscard]] int line() const { return line_; }
            [[nodiscard]] int column() const { return column_; }
            [[nodiscard]] const std::string& expected() const { return expected_; }

        private:
            std::size_t offset_;
            int line_;
            int column_;
            std::string expected_;
    };

    // Variant bound whose lower limit exceeds its upper limit, e.g. {3-2$$a|b|c}
    class invalid_bound_error : public syntax_error {
        public:
            invalid_bound_error(const std::string& msg, std::size_t offset, int line, int column,
                                std::size_t lower, std::size_t upper)
                : syntax_error(msg, offset, line, column, "lower bound <= upper bound"),
                  lower_(lower),
                  upper_(upper) {
            }

            [[nodiscard]] std::size_t lower() const { return lower_; }
            [[nodiscard]] std::size_t upper() const { return upper_; }

        private:
            std::size_t lower_;
            std::size_t upper_;
    };

    class configuration_error : public std::runtime_error {
        public:
            configuration_error(const std::string& option, const std::string& msg)
                : std::runtime_error(msg), option_(option) {
            }

            const std::string& option() const { return option_; }

        private:
            std::string option_;
    };

    class generation_error : public std::runtime_error {
        public:
            explicit generation_error(const std::string& msg)
                : std::runtime_error(msg) {
            }
    };

    class unresolved_wildcard_error : public generation_error {
        public:
            explicit unresolved_wildcard_error(const std::string& wildcard)
                : generation_error(build_message(wildcard)),
                  wildcard_(wildcard) {
            }

            const std::string& wildcard() const { return wildcard_; }

        private:
            std::string wildcard_;

            static std::string build_message(const std::string& wildcard);
    };

    class recursion_limit_error : public generation_error {
        public:
            recursion_limit_error(const std::string& what_was_expanded, std::size_t depth)
                : generation_error(build_message(what_was_expanded, depth)),
                  depth_(depth) {
            }

            std::size_t depth() const { return depth_; }

        private:
            std::size_t depth_;

            static std::string build_message(const std::string& what_was_expanded, std::size_t depth);
    };
}
