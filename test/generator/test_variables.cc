//
// Variable assignment and access during generation
//

#include <doctest/doctest.h>
#include <promptgen/errors.hh>
#include <promptgen/generator.hh>
#include <promptgen/parser.hh>
#include <promptgen/variable_context.hh>

using namespace promptgen;

namespace {
    using strings = std::vector<std::string>;

    std::string render_once(const std::string& text) {
        null_wildcard_resolver resolver;
        auto results = generate(text, sampling_method::combinatorial, resolver, 1);
        REQUIRE(results.size() == 1);
        return results.front();
    }
}

TEST_SUITE("Generator - Variables") {
    TEST_CASE("Assigned value is used by later accesses") {
        CHECK(render_once("${size=small}${size} cat") == "small cat");
    }

    TEST_CASE("Assignment itself renders nothing") {
        CHECK(render_once("a${x=b}c") == "ac");
    }

    TEST_CASE("Later assignment overwrites") {
        CHECK(render_once("${x=A}${x=B}${x}") == "B");
    }

    TEST_CASE("Preserving assignment keeps an existing binding") {
        CHECK(render_once("${x=A}${x?=B}${x}") == "A");
        CHECK(render_once("${x?=B}${x}") == "B");
    }

    TEST_CASE("Unbound access renders empty") {
        CHECK(render_once("[${nothing}]") == "[]");
    }

    TEST_CASE("Unbound access renders its default") {
        CHECK(render_once("${x:fallback}") == "fallback");
        CHECK(render_once("${x=set}${x:fallback}") == "set");
    }

    TEST_CASE("Access before assignment sees nothing") {
        null_wildcard_resolver resolver;
        CHECK(generate("${x}${x=set}", sampling_method::random, resolver, 3) ==
              strings{"", "", ""});
    }

    TEST_CASE("Deferred value is sampled on every access") {
        null_wildcard_resolver resolver;
        CHECK(generate("${x={a|b}}${x}-${x}", sampling_method::combinatorial, resolver, 10) ==
              strings{"a-a", "a-b", "b-a", "b-b"});
    }

    TEST_CASE("Immediate value is sampled once") {
        null_wildcard_resolver resolver;
        CHECK(generate("${x=!{a|b}}${x}-${x}", sampling_method::combinatorial, resolver, 10) ==
              strings{"a-a", "b-b"});
    }

    TEST_CASE("Deferred value sees bindings made after the assignment") {
        CHECK(render_once("${greeting=hi ${name}}${name=bob}${greeting}") == "hi bob");
    }

    TEST_CASE("Immediate value captures bindings at assignment time") {
        CHECK(render_once("${greeting=!hi ${name}}${name=bob}${greeting}") == "hi ");
    }

    TEST_CASE("Variable used inside a variant option") {
        null_wildcard_resolver resolver;
        CHECK(generate("${animal=cat}{${animal}s|dogs}", sampling_method::cyclical, resolver, 3) ==
              strings{"cats", "dogs", "cats"});
    }

    TEST_CASE("Self-referencing variable hits the recursion limit") {
        null_wildcard_resolver resolver;
        CHECK_THROWS_AS(generate("${x=${x}a}${x}", sampling_method::random, resolver, 1),
                        recursion_limit_error);
    }

    TEST_CASE("Immediate self-reference reads the previous value") {
        CHECK(render_once("${x=a}${x=!${x}b}${x}") == "ab");
    }
}

TEST_SUITE("Variable context") {
    TEST_CASE("Assign and find") {
        variable_context ctx;
        CHECK_FALSE(ctx.contains("x"));
        CHECK(ctx.find("x") == nullptr);

        CHECK(ctx.assign("x", std::string("red")));
        REQUIRE(ctx.find("x") != nullptr);
        CHECK(std::get<std::string>(*ctx.find("x")) == "red");
        CHECK(ctx.size() == 1);
    }

    TEST_CASE("Assign without overwrite") {
        variable_context ctx;
        ctx.assign("x", std::string("red"));
        CHECK_FALSE(ctx.assign("x", std::string("blue"), false));
        CHECK(std::get<std::string>(*ctx.find("x")) == "red");
        CHECK(ctx.assign("x", std::string("blue"), true));
        CHECK(std::get<std::string>(*ctx.find("x")) == "blue");
    }

    TEST_CASE("Deferred binding keeps the command") {
        auto value = parse("{a|b}");
        variable_context ctx;
        ctx.assign("x", variable_context::deferred{&value});
        CHECK(std::get<variable_context::deferred>(*ctx.find("x")) == &value);
    }

    TEST_CASE("Nested scope reads through to its parent") {
        variable_context outer;
        outer.assign("x", std::string("outer"));

        variable_context inner(&outer);
        CHECK(inner.parent() == &outer);
        CHECK(inner.contains("x"));
        CHECK(inner.size() == 0);

        inner.assign("x", std::string("inner"));
        CHECK(std::get<std::string>(*inner.find("x")) == "inner");
        CHECK(std::get<std::string>(*outer.find("x")) == "outer");
    }

    TEST_CASE("Preserving assignment sees parent bindings") {
        variable_context outer;
        outer.assign("x", std::string("outer"));
        variable_context inner(&outer);
        CHECK_FALSE(inner.assign("x", std::string("inner"), false));
        CHECK(inner.size() == 0);
    }
}
