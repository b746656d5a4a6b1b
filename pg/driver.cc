#include "driver.hh"
#include <promptgen/command_dump.hh>
#include <promptgen/errors.hh>
#include <promptgen/generator.hh>
#include <promptgen/parser.hh>
#include <fstream>
#include <iostream>
#include <sstream>

namespace promptgen::driver {

Driver::Driver(const DriverOptions& options, Logger& logger)
    : options_(options)
    , logger_(logger)
{
}

int Driver::run() {
    std::string text;
    try {
        text = load_template();
        command root = parse_template(text);

        if (options_.dump_tree) {
            std::string dump = dump_command(root);
            if (!dump.empty() && dump.back() == '\n') {
                dump.pop_back();
            }
            logger_.output(dump);
            return 0;
        }

        return generate_prompts(root);

    } catch (const syntax_error& e) {
        logger_.syntax_error(e, text);
        return 1;
    } catch (const configuration_error& e) {
        logger_.error("Invalid grammar option '" + e.option() + "': " + e.what());
        return 1;
    } catch (const generation_error& e) {
        logger_.error(std::string("Generation failed: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        logger_.error(std::string("Error: ") + e.what());
        return 1;
    }
}

// ============================================================================
// Pipeline Stages
// ============================================================================

std::string Driver::load_template() {
    if (options_.inline_template) {
        logger_.verbose("Template from command line");
        return *options_.inline_template;
    }

    const auto& path = *options_.template_file;
    logger_.verbose("Loading: " + path.string());

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open template file: " + path.string());
    }
    std::ostringstream content;
    content << in.rdbuf();

    // A trailing newline is not part of the template
    std::string text = content.str();
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

command Driver::parse_template(const std::string& text) {
    logger_.verbose("Parsing template (" + std::to_string(text.size()) + " bytes)");
    auto p = get_parser(options_.grammar);
    command root = p->parse(text);
    logger_.debug("Parser cache entries: " + std::to_string(parser_cache_size()));
    return root;
}

int Driver::generate_prompts(const command& root) {
    auto resolver = make_resolver();

    generation_options gen_opts;
    gen_opts.method = options_.method;
    gen_opts.seed = options_.seed;
    gen_opts.empty_wildcards = options_.empty_wildcards;
    gen_opts.config = options_.grammar;

    logger_.verbose(std::string("Generating ") + std::to_string(options_.count) +
                    " prompt(s), method: " + to_string(options_.method));
    if (options_.seed) {
        logger_.debug("Seed: " + std::to_string(*options_.seed));
    }

    generator engine(*resolver, gen_opts);
    auto prompts = engine.generate(root, options_.count);

    for (const auto& prompt : prompts) {
        logger_.output(prompt);
    }

    if (prompts.size() < options_.count) {
        logger_.warning("Only " + std::to_string(prompts.size()) + " distinct prompt(s) exist for this template");
    }
    return 0;
}

std::unique_ptr<wildcard_resolver> Driver::make_resolver() {
    if (options_.wildcard_dirs.empty()) {
        logger_.debug("No wildcard directories");
        return std::make_unique<null_wildcard_resolver>();
    }
    for (const auto& dir : options_.wildcard_dirs) {
        logger_.debug("Wildcard directory: " + dir.string());
    }
    return std::make_unique<directory_wildcard_resolver>(options_.wildcard_dirs);
}

}  // namespace promptgen::driver
