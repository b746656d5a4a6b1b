//
// Command construction rules
//

#include <doctest/doctest.h>
#include <promptgen/command.hh>
#include <promptgen/errors.hh>
#include <promptgen/generator.hh>

#include <set>

using namespace promptgen;

namespace {
    std::vector<variant_option> options_of(std::initializer_list<const char*> texts) {
        std::vector<variant_option> options;
        for (const char* text : texts) {
            options.push_back(make_option(make_literal(text)));
        }
        return options;
    }
}

TEST_SUITE("Commands - Builders") {
    TEST_CASE("Sequence collapsing") {
        SUBCASE("no children") {
            auto cmd = make_sequence({});
            REQUIRE(is_literal(cmd));
            CHECK(*literal_text(cmd) == "");
        }
        SUBCASE("one child") {
            std::vector<command> children;
            children.push_back(make_literal("only"));
            auto cmd = make_sequence(std::move(children));
            REQUIRE(is_literal(cmd));
            CHECK(*literal_text(cmd) == "only");
        }
        SUBCASE("two children") {
            std::vector<command> children;
            children.push_back(make_literal("a"));
            children.push_back(make_literal("b"));
            auto cmd = make_sequence(std::move(children));
            CHECK(std::holds_alternative<sequence_command>(cmd.node));
        }
    }

    TEST_CASE("Variant bounds are clamped to the option count") {
        auto cmd = make_variant(options_of({"a", "b", "c"}), 0, 10);
        const auto& v = std::get<variant_command>(cmd.node);
        CHECK(v.min_bound == 1);
        CHECK(v.max_bound == 3);
    }

    TEST_CASE("Inverted variant bounds") {
        CHECK_THROWS_AS(make_variant(options_of({"a", "b"}), 2, 1), invalid_bound_error);
    }

    TEST_CASE("Negative weight") {
        CHECK_THROWS_AS(make_option(make_literal("a"), -1.0), std::invalid_argument);
    }

    TEST_CASE("Probability outside [0, 1]") {
        CHECK_THROWS_AS(make_probability(1.5, make_literal("a")), std::invalid_argument);
        CHECK_THROWS_AS(make_probability(-0.1, make_literal("a")), std::invalid_argument);
        CHECK_NOTHROW(make_probability(1.0, make_literal("a")));
    }

    TEST_CASE("Literal wildcard path becomes a trimmed name") {
        auto cmd = make_wildcard(make_literal(" colors "));
        const auto& w = std::get<wildcard_command>(cmd.node);
        CHECK(w.name == "colors");
        CHECK(w.dynamic_name == nullptr);
    }

    TEST_CASE("Invalid condition pattern") {
        CHECK_THROWS_AS(make_condition_arm("(", make_literal("x")), std::regex_error);
    }

    TEST_CASE("Stateful nodes get distinct ids") {
        std::set<node_id> ids;
        ids.insert(std::get<variant_command>(make_variant(options_of({"a"})).node).id);
        ids.insert(std::get<wildcard_command>(make_wildcard(make_literal("w")).node).id);
        ids.insert(std::get<probability_command>(make_probability(0.5, make_literal("p")).node).id);
        CHECK(ids.size() == 3);
    }

    TEST_CASE("Sampling method names and symbols") {
        CHECK(sampling_method_from_symbol('~') == sampling_method::random);
        CHECK(sampling_method_from_symbol('!') == sampling_method::combinatorial);
        CHECK(sampling_method_from_symbol('@') == sampling_method::cyclical);
        CHECK_FALSE(sampling_method_from_symbol('x').has_value());
        CHECK(sampling_method_from_name("cyclical") == sampling_method::cyclical);
        CHECK(std::string(to_string(sampling_method::combinatorial)) == "combinatorial");
    }

    TEST_CASE("Programmatically built tree generates") {
        std::vector<command> children;
        children.push_back(make_literal("a "));
        children.push_back(make_variant(options_of({"x", "y", "z"}), 2, 2, ","));
        auto root = make_sequence(std::move(children));

        null_wildcard_resolver resolver;
        auto results = generate(root, sampling_method::combinatorial, resolver, 10);
        REQUIRE(results.size() == 3);
        CHECK(results[0] == "a x,y");
        CHECK(results[1] == "a x,z");
        CHECK(results[2] == "a y,z");
    }
}
