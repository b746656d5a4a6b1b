//
// Basic parser functionality tests
//

#include <doctest/doctest.h>
#include <promptgen/parser.hh>

using namespace promptgen;

namespace {
    template <typename T>
    const T& node_as(const command& cmd) {
        REQUIRE(std::holds_alternative<T>(cmd.node));
        return std::get<T>(cmd.node);
    }

    std::string text_of(const command& cmd) {
        return node_as<literal_command>(cmd).text;
    }
}

TEST_SUITE("Parser - Basic Functionality") {
    TEST_CASE("Empty input produces empty literal") {
        auto cmd = parse("");
        CHECK(text_of(cmd) == "");
    }

    TEST_CASE("Alphanumeric input is a single literal") {
        auto cmd = parse("hello42");
        CHECK(text_of(cmd) == "hello42");
    }

    TEST_CASE("Plain text with spaces and punctuation stays literal") {
        auto cmd = parse("a photo of a cat, 4k.");
        CHECK(text_of(cmd) == "a photo of a cat, 4k.");
    }

    TEST_CASE("Closing punctuation outside a block is literal text") {
        auto cmd = parse("a} b|c :: d$$");
        CHECK(text_of(cmd) == "a} b|c :: d$$");
    }

    TEST_CASE("Text and directives form a sequence") {
        auto cmd = parse("a {x|y} b");
        const auto& seq = node_as<sequence_command>(cmd);
        REQUIRE(seq.children.size() == 3);
        CHECK(text_of(seq.children[0]) == "a ");
        CHECK(std::holds_alternative<variant_command>(seq.children[1].node));
        CHECK(text_of(seq.children[2]) == " b");
    }

    TEST_CASE("Single directive is not wrapped in a sequence") {
        auto cmd = parse("{x|y}");
        CHECK(std::holds_alternative<variant_command>(cmd.node));
    }
}

TEST_SUITE("Parser - Comments") {
    TEST_CASE("Line comment at start is dropped with its newline") {
        auto cmd = parse("# heading\nred ball");
        CHECK(text_of(cmd) == "red ball");
    }

    TEST_CASE("Fragments split by a comment are joined with one space") {
        auto cmd = parse("red# note\nball");
        CHECK(text_of(cmd) == "red ball");
    }

    TEST_CASE("No extra space when a fragment already ends in whitespace") {
        auto cmd = parse("red # note\nball");
        CHECK(text_of(cmd) == "red ball");
    }

    TEST_CASE("C++ style comments between directives") {
        auto cmd = parse("{a|b}// trailing\n{c|d}/* block */");
        const auto& seq = node_as<sequence_command>(cmd);
        REQUIRE(seq.children.size() == 2);
        CHECK(std::holds_alternative<variant_command>(seq.children[0].node));
        CHECK(std::holds_alternative<variant_command>(seq.children[1].node));
    }

    TEST_CASE("Double slash inside a literal is kept") {
        auto cmd = parse("see http://example.org");
        CHECK(text_of(cmd) == "see http://example.org");
    }

    TEST_CASE("Comment block") {
        auto cmd = parse("{* just a note *}");
        const auto& comment = node_as<comment_command>(cmd);
        CHECK(comment.text == " just a note ");
    }
}

TEST_SUITE("Parser - Errors") {
    TEST_CASE("Unterminated variant") {
        CHECK_THROWS_AS(parse("a {x|y"), syntax_error);
    }

    TEST_CASE("Error position is reported as line and column") {
        try {
            (void)parse("ok\n{a");
            FAIL("expected syntax_error");
        } catch (const syntax_error& e) {
            CHECK(e.line() == 2);
            CHECK(e.column() == 3);
            CHECK(e.offset() == 5);
            CHECK(e.expected().find("'}'") != std::string::npos);
        }
    }

    TEST_CASE("Unterminated wildcard") {
        CHECK_THROWS_AS(parse("__colors"), syntax_error);
    }

    TEST_CASE("Unterminated variable access") {
        CHECK_THROWS_AS(parse("${name"), syntax_error);
    }

    TEST_CASE("Inverted bound") {
        try {
            (void)parse("{3-2$$a|b|c}");
            FAIL("expected invalid_bound_error");
        } catch (const invalid_bound_error& e) {
            CHECK(e.lower() == 3);
            CHECK(e.upper() == 2);
            CHECK(e.column() == 2);
        }
    }

    TEST_CASE("Invalid bound is a syntax error") {
        CHECK_THROWS_AS(parse("{3-2$$a|b|c}"), syntax_error);
    }

    TEST_CASE("Invalid regular expression in a condition") {
        CHECK_THROWS_AS(parse("{[::x}"), syntax_error);
    }

    TEST_CASE("Runaway nesting is rejected") {
        std::string text;
        for (int i = 0; i < 300; ++i) text += "{a|";
        text += "b";
        for (int i = 0; i < 300; ++i) text += "}";
        CHECK_THROWS_AS(parse(text), syntax_error);
    }
}

TEST_SUITE("Parser - Alphanumeric Delimiters") {
    TEST_CASE("Alphanumeric wildcard wrap is still recognised") {
        grammar_config config;
        config.wildcard_wrap = "WW";

        auto tight = parse("WWcolorsWW", config);
        CHECK(node_as<wildcard_command>(tight).name == "colors");

        auto spaced = parse("WWcolors WW", config);
        CHECK_FALSE(std::holds_alternative<literal_command>(spaced.node));
    }

    TEST_CASE("Alphanumeric delimiters disable the literal shortcut") {
        grammar_config config;
        config.variant_start = "X";
        config.variant_end = "Y";
        CHECK_FALSE(get_parser(config)->alnum_is_literal());
        CHECK(get_parser(default_grammar_config())->alnum_is_literal());

        auto cmd = parse("XredYblue", config);
        CHECK_FALSE(std::holds_alternative<literal_command>(cmd.node));
    }

    TEST_CASE("Inline wildcard variable values see alphanumeric delimiters") {
        grammar_config config;
        config.variant_start = "X";
        config.variant_end = "Y";

        auto cmd = parse("__pets(c=XredY)__", config);
        const auto& w = node_as<wildcard_command>(cmd);
        REQUIRE(w.variables.count("c") == 1);
        CHECK_FALSE(std::holds_alternative<literal_command>(w.variables.at("c")->node));
    }
}
