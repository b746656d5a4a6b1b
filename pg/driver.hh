#pragma once

#include "driver_options.hh"
#include "logger.hh"

#include <memory>
#include <string>

#include <promptgen/command.hh>
#include <promptgen/wildcard_resolver.hh>

namespace promptgen::driver {

/// Command-line driver: template in, prompts out
class Driver {
public:
    explicit Driver(const DriverOptions& options, Logger& logger);

    /// Returns 0 on success, non-zero on error
    int run();

private:
    // ========================================================================
    // Pipeline Stages
    // ========================================================================

    /// Stage 1: Read the template text (-e or file)
    std::string load_template();

    /// Stage 2: Parse with the configured delimiters
    command parse_template(const std::string& text);

    /// Stage 3: Expand into prompts
    int generate_prompts(const command& root);

    std::unique_ptr<wildcard_resolver> make_resolver();

    // ========================================================================
    // State
    // ========================================================================

    const DriverOptions& options_;
    Logger& logger_;
};

}  // namespace promptgen::driver
