//
// Grammar configuration validation
//

#include <doctest/doctest.h>
#include <promptgen/grammar_config.hh>
#include <promptgen/errors.hh>

using namespace promptgen;

TEST_SUITE("Grammar Config") {
    TEST_CASE("Defaults") {
        const auto& config = default_grammar_config();
        CHECK(config.variant_start == "{");
        CHECK(config.variant_end == "}");
        CHECK(config.wildcard_wrap == "__");
        CHECK(config.variable_start == "${");
        CHECK(config.variable_end == "}");
        CHECK(config.wrap_start == "%{");
        CHECK(config.wrap_end == "}");
        CHECK_NOTHROW(config.validate());
    }

    TEST_CASE("Empty delimiter") {
        grammar_config config;
        config.wrap_end = "";
        try {
            config.validate();
            FAIL("expected configuration_error");
        } catch (const configuration_error& e) {
            CHECK(e.option() == "wrap_end");
        }
    }

    TEST_CASE("Whitespace in a delimiter") {
        grammar_config config;
        config.variant_start = "< ";
        CHECK_THROWS_AS(config.validate(), configuration_error);
    }

    TEST_CASE("Opening delimiters must differ") {
        grammar_config config;
        config.wildcard_wrap = "{";
        try {
            config.validate();
            FAIL("expected configuration_error");
        } catch (const configuration_error& e) {
            CHECK(e.option() == "wildcard_wrap");
        }
    }

    TEST_CASE("Opening delimiter may not be fixed punctuation") {
        grammar_config config;
        SUBCASE("option separator") { config.variant_start = "|"; }
        SUBCASE("bound delimiter") { config.wildcard_wrap = "$$"; }
        SUBCASE("weight delimiter") { config.variable_start = "::"; }
        SUBCASE("line comment") { config.wrap_start = "#"; }
        CHECK_THROWS_AS(config.validate(), configuration_error);
    }

    TEST_CASE("Closing delimiter may not be fixed punctuation") {
        grammar_config config;
        std::string option;
        SUBCASE("variant end as option separator") { config.variant_end = "|"; option = "variant_end"; }
        SUBCASE("variant end as weight delimiter") { config.variant_end = "::"; option = "variant_end"; }
        SUBCASE("variable end as bound delimiter") { config.variable_end = "$$"; option = "variable_end"; }
        SUBCASE("wrap end as line comment") { config.wrap_end = "#"; option = "wrap_end"; }
        try {
            config.validate();
            FAIL("expected configuration_error");
        } catch (const configuration_error& e) {
            CHECK(e.option() == option);
        }
    }

    TEST_CASE("Variant end must differ from variant start") {
        grammar_config config;
        config.variant_start = "|-";
        config.variant_end = "|-";
        CHECK_THROWS_AS(config.validate(), configuration_error);
    }

    TEST_CASE("Closing delimiters may be shared") {
        grammar_config config;
        config.variant_end = ">";
        config.variable_end = ">";
        config.wrap_end = ">";
        CHECK_NOTHROW(config.validate());
    }

    TEST_CASE("Equality and hashing by value") {
        grammar_config a;
        grammar_config b;
        CHECK(a == b);
        CHECK(grammar_config_hash{}(a) == grammar_config_hash{}(b));

        b.wildcard_wrap = "%%";
        CHECK_FALSE(a == b);
    }
}
