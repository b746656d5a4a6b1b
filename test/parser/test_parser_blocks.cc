//
// Variant, probability and condition blocks
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

TEST_SUITE("Parser - Variants") {
    TEST_CASE("Options with default bound and separator") {
        auto cmd = parse("{x|y}");
        const auto& v = node_as<variant_command>(cmd);
        REQUIRE(v.options.size() == 2);
        CHECK(text_of(*v.options[0].value) == "x");
        CHECK(text_of(*v.options[1].value) == "y");
        CHECK(v.options[0].weight == 1.0);
        CHECK(v.min_bound == 1);
        CHECK(v.max_bound == 1);
        CHECK(v.separator == ",");
        CHECK_FALSE(v.method.has_value());
    }

    TEST_CASE("Whitespace around options is trimmed, interior kept") {
        auto cmd = parse("{  red car |  big  green car }");
        const auto& v = node_as<variant_command>(cmd);
        REQUIRE(v.options.size() == 2);
        CHECK(text_of(*v.options[0].value) == "red car");
        CHECK(text_of(*v.options[1].value) == "big  green car");
    }

    TEST_CASE("Empty option") {
        auto cmd = parse("{a|}");
        const auto& v = node_as<variant_command>(cmd);
        REQUIRE(v.options.size() == 2);
        CHECK(text_of(*v.options[1].value) == "");
    }

    TEST_CASE("Exact bound with separator") {
        auto cmd = parse("{2$$ and $$x|y|z}");
        const auto& v = node_as<variant_command>(cmd);
        CHECK(v.min_bound == 2);
        CHECK(v.max_bound == 2);
        CHECK(v.separator == "and");
        CHECK(v.options.size() == 3);
    }

    TEST_CASE("Separator padding is trimmed") {
        CHECK(node_as<variant_command>(parse("{2$$ , $$x|y|z}")).separator == ",");
        CHECK(node_as<variant_command>(parse("{2$$\t; $$x|y}")).separator == ";");
    }

    TEST_CASE("Whitespace-only separator is kept") {
        CHECK(node_as<variant_command>(parse("{2$$ $$x|y}")).separator == " ");
    }

    TEST_CASE("Range bound keeps the default separator") {
        auto cmd = parse("{1-2$$x|y|z}");
        const auto& v = node_as<variant_command>(cmd);
        CHECK(v.min_bound == 1);
        CHECK(v.max_bound == 2);
        CHECK(v.separator == ",");
    }

    TEST_CASE("Open bounds") {
        SUBCASE("upper only") {
            const auto& v = node_as<variant_command>(parse("{-2$$x|y|z}"));
            CHECK(v.min_bound == 1);
            CHECK(v.max_bound == 2);
        }
        SUBCASE("lower only") {
            auto cmd = parse("{2-$$x|y|z}");
            const auto& v = node_as<variant_command>(cmd);
            CHECK(v.min_bound == 2);
            CHECK(v.max_bound == 3);
        }
    }

    TEST_CASE("Bound larger than the option count is clamped") {
        auto cmd = parse("{5$$a|b}");
        const auto& v = node_as<variant_command>(cmd);
        CHECK(v.min_bound == 2);
        CHECK(v.max_bound == 2);
    }

    TEST_CASE("Sampling method symbols") {
        CHECK(node_as<variant_command>(parse("{~x|y}")).method == sampling_method::random);
        CHECK(node_as<variant_command>(parse("{!x|y}")).method == sampling_method::combinatorial);
        CHECK(node_as<variant_command>(parse("{@x|y}")).method == sampling_method::cyclical);
    }

    TEST_CASE("Sampling method before a bound") {
        auto cmd = parse("{@2$$a|b|c}");
        const auto& v = node_as<variant_command>(cmd);
        CHECK(v.method == sampling_method::cyclical);
        CHECK(v.min_bound == 2);
    }

    TEST_CASE("Weights") {
        auto cmd = parse("{2::x|0.5::y|z}");
        const auto& v = node_as<variant_command>(cmd);
        REQUIRE(v.options.size() == 3);
        CHECK(v.options[0].weight == 2.0);
        CHECK(v.options[1].weight == 0.5);
        CHECK(v.options[2].weight == 1.0);
        CHECK(text_of(*v.options[0].value) == "x");
    }

    TEST_CASE("Weighted option after a plain one") {
        auto cmd = parse("{a|3::b}");
        const auto& v = node_as<variant_command>(cmd);
        REQUIRE(v.options.size() == 2);
        CHECK(v.options[1].weight == 3.0);
    }

    TEST_CASE("Nested variants") {
        auto cmd = parse("{x|{y|z}}");
        const auto& v = node_as<variant_command>(cmd);
        REQUIRE(v.options.size() == 2);
        const auto& inner = node_as<variant_command>(*v.options[1].value);
        CHECK(inner.options.size() == 2);
    }

    TEST_CASE("Each variant gets its own node id") {
        auto a = parse("{x|y}");
        auto b = parse("{x|y}");
        CHECK(node_as<variant_command>(a).id != node_as<variant_command>(b).id);
    }
}

TEST_SUITE("Parser - Probability and Condition") {
    TEST_CASE("Probability block") {
        auto cmd = parse("{0.25::hat}");
        const auto& p = node_as<probability_command>(cmd);
        CHECK(p.chance == doctest::Approx(0.25));
        CHECK(text_of(*p.value) == "hat");
    }

    TEST_CASE("Probability with a sampling method") {
        auto cmd = parse("{@0.5::hat}");
        const auto& p = node_as<probability_command>(cmd);
        CHECK(p.method == sampling_method::cyclical);
    }

    TEST_CASE("Bare number above one is a weight, not a probability") {
        auto cmd = parse("{2::x}");
        const auto& v = node_as<variant_command>(cmd);
        REQUIRE(v.options.size() == 1);
        CHECK(v.options[0].weight == 2.0);
    }

    TEST_CASE("Number followed by alternatives is a weighted variant") {
        auto cmd = parse("{0.5::x|y}");
        const auto& v = node_as<variant_command>(cmd);
        REQUIRE(v.options.size() == 2);
        CHECK(v.options[0].weight == 0.5);
    }

    TEST_CASE("Condition with else branch") {
        auto cmd = parse("{cat::meow|woof}");
        const auto& c = node_as<condition_command>(cmd);
        REQUIRE(c.arms.size() == 1);
        CHECK(c.arms[0].pattern == "cat");
        CHECK_FALSE(c.arms[0].context_key.has_value());
        CHECK(text_of(*c.arms[0].value) == "meow");
        CHECK(text_of(*c.else_value) == "woof");
    }

    TEST_CASE("Condition without else renders nothing on mismatch") {
        auto cmd = parse("{cat::meow}");
        const auto& c = node_as<condition_command>(cmd);
        CHECK(text_of(*c.else_value) == "");
    }

    TEST_CASE("Chained condition arms") {
        auto cmd = parse("{ cat :: V1 | ca :: V2 | none }");
        const auto& c = node_as<condition_command>(cmd);
        REQUIRE(c.arms.size() == 2);
        CHECK(c.arms[0].pattern == "cat");
        CHECK(c.arms[1].pattern == "ca");
        CHECK(text_of(*c.arms[1].value) == "V2");
        CHECK(text_of(*c.else_value) == "none");
    }

    TEST_CASE("Condition on a named variable") {
        auto cmd = parse("{${animal}cat::meow|woof}");
        const auto& c = node_as<condition_command>(cmd);
        REQUIRE(c.arms.size() == 1);
        REQUIRE(c.arms[0].context_key.has_value());
        CHECK(*c.arms[0].context_key == "animal");
        CHECK(c.arms[0].pattern == "cat");
    }

    TEST_CASE("Regular expression patterns") {
        auto cmd = parse("{^c.t$::yes}");
        const auto& c = node_as<condition_command>(cmd);
        CHECK(c.arms[0].pattern == "^c.t$");
    }
}
