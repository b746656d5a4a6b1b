//
// Compiled parser cache
//

#include <doctest/doctest.h>
#include <promptgen/parser.hh>

#include <string>

using namespace promptgen;

namespace {
    grammar_config cache_test_config(const std::string& start, const std::string& end) {
        grammar_config config;
        config.variant_start = start;
        config.variant_end = end;
        return config;
    }
}

TEST_SUITE("Parser Cache") {
    TEST_CASE("Same configuration shares one parser") {
        auto config = cache_test_config("<<", ">>");
        auto first = get_parser(config);
        auto second = get_parser(cache_test_config("<<", ">>"));
        CHECK(first.get() == second.get());
        CHECK(first->config() == config);
    }

    TEST_CASE("Different configurations get different parsers") {
        auto angle = get_parser(cache_test_config("<", ">"));
        auto square = get_parser(cache_test_config("[", "]"));
        CHECK(angle.get() != square.get());
    }

    TEST_CASE("Entries outlive the handles that created them") {
        const std::size_t before = parser_cache_size();
        const parser* built = nullptr;
        {
            auto p = get_parser(cache_test_config("(<", ">)"));
            built = p.get();
            CHECK(parser_cache_size() == before + 1);
        }
        CHECK(parser_cache_size() == before + 1);

        auto again = get_parser(cache_test_config("(<", ">)"));
        CHECK(again.get() == built);
        CHECK(parser_cache_size() == before + 1);
    }

    TEST_CASE("Free parse reuses the default parser") {
        auto first = parse("{a|b}");
        const std::size_t size = parser_cache_size();
        const parser* shared = get_parser(default_grammar_config()).get();

        auto second = parse("{c|d}");
        CHECK(parser_cache_size() == size);
        CHECK(get_parser(default_grammar_config()).get() == shared);
        CHECK(get_parser(grammar_config{}).get() == shared);
    }

    TEST_CASE("Cache is bounded and keeps the default configuration") {
        const parser* shared = get_parser(default_grammar_config()).get();

        for (std::size_t i = 0; i < parser_cache_capacity + 8; ++i) {
            auto p = get_parser(cache_test_config("<" + std::to_string(i) + "<", ">"));
            CHECK(parser_cache_size() <= parser_cache_capacity);
        }

        CHECK(parser_cache_size() == parser_cache_capacity);
        CHECK(get_parser(default_grammar_config()).get() == shared);
    }

    TEST_CASE("Invalid configuration is not cached") {
        const std::size_t before = parser_cache_size();
        CHECK_THROWS_AS(get_parser(cache_test_config("|", "}")), configuration_error);
        CHECK(parser_cache_size() == before);
    }

    TEST_CASE("Cached parser parses with its own delimiters") {
        auto p = get_parser(cache_test_config("<", ">"));
        auto cmd = p->parse("<a|b>");
        CHECK(std::holds_alternative<variant_command>(cmd.node));
    }
}
