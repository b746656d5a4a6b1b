//
// Driver logger
//

#include <doctest/doctest.h>
#include "logger.hh"

#include <sstream>

using namespace promptgen;
using namespace promptgen::driver;

TEST_SUITE("Driver - Logger") {
    TEST_CASE("Routing by stream") {
        std::ostringstream out, err;
        Logger logger(LogLevel::Normal, ColorMode::Never, out, err);

        logger.error("bad");
        logger.warning("careful");
        logger.info("hello");
        logger.output("a red ball");

        CHECK(err.str() == "error: bad\nwarning: careful\n");
        CHECK(out.str() == "hello\na red ball\n");
    }

    TEST_CASE("Levels filter messages") {
        std::ostringstream out, err;
        Logger logger(LogLevel::Quiet, ColorMode::Never, out, err);

        logger.warning("careful");
        logger.info("hello");
        logger.verbose("details");
        logger.debug("internals");
        logger.output("prompt");
        logger.error("bad");

        CHECK(out.str() == "prompt\n");
        CHECK(err.str() == "error: bad\n");

        logger.set_level(LogLevel::Debug);
        CHECK(logger.get_level() == LogLevel::Debug);
        logger.verbose("details");
        logger.debug("internals");
        CHECK(out.str() == "prompt\ndetails\n[debug] internals\n");
    }

    TEST_CASE("Syntax error shows the template line and a caret") {
        std::ostringstream out, err;
        Logger logger(LogLevel::Normal, ColorMode::Never, out, err);

        const std::string source = "first line\n\ta {x|y";
        syntax_error e("Syntax error at line 2, column 8: expected '}'", 17, 2, 8, "'}'");
        logger.syntax_error(e, source);

        CHECK(err.str() ==
              "error: Syntax error at line 2, column 8: expected '}'\n"
              "  \ta {x|y\n"
              "  \t      ^\n");
    }

    TEST_CASE("Caret is skipped when the line is unknown") {
        std::ostringstream out, err;
        Logger logger(LogLevel::Normal, ColorMode::Never, out, err);

        syntax_error e("Syntax error", 0, 3, 1, "text");
        logger.syntax_error(e, "only one line");
        CHECK(err.str() == "error: Syntax error\n");
    }
}
