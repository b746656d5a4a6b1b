//
// Generation engine: expands a command tree into output strings.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "command.hh"
#include "grammar_config.hh"
#include "parser.hh"
#include "wildcard_resolver.hh"

namespace promptgen {
    enum class empty_wildcard_policy {
        error,  // unresolved_wildcard_error under every sampling method
        empty   // the wildcard contributes an empty string
    };

    const char* to_string(empty_wildcard_policy policy);
    std::optional<empty_wildcard_policy> empty_wildcard_policy_from_name(const std::string& name);

    struct generation_options {
        sampling_method method = sampling_method::random;
        std::optional<std::uint64_t> seed;   // Unset: seeded from std::random_device
        empty_wildcard_policy empty_wildcards = empty_wildcard_policy::error;
        grammar_config config;               // Used for text input and wildcard candidates
    };

    /**
     * Round-robin positions of cyclical nodes, keyed by node id.
     *
     * Kept apart from the tree so one parsed tree can be shared read-only by
     * random and combinatorial callers while each cyclical caller owns its
     * own positions.
     */
    class cyclical_state {
        public:
            // Returns the current position of the node, then advances it modulo `modulus`
            std::size_t advance(node_id id, std::size_t modulus);

            [[nodiscard]] std::size_t position(node_id id) const;
            [[nodiscard]] std::size_t size() const { return m_positions.size(); }
            void reset() { m_positions.clear(); }

        private:
            std::unordered_map<node_id, std::size_t> m_positions;
    };

    /**
     * Odometer over the choice points met while rendering one output.
     *
     * Choice points are numbered in walk order. Each render replays the
     * recorded indices and appends fresh points (index 0) past the end;
     * advance() then steps the last point, carrying into earlier ones, so
     * the last choice point varies fastest.
     */
    class choice_path {
        public:
            // Index to take at the next choice point among `count` alternatives
            std::size_t choose(std::size_t count);

            // Back to the first choice point before replaying a render
            void rewind() { m_cursor = 0; }

            // Moves to the next combination; false once every one has been produced
            bool advance();

            void reset();

            [[nodiscard]] std::size_t depth() const { return m_points.size(); }

        private:
            struct point {
                std::size_t index;
                std::size_t count;
            };

            std::vector<point> m_points;
            std::size_t m_cursor = 0;
    };

    /**
     * Stateful generation engine.
     *
     * Keeps its random engine, the cyclical positions and the parsed
     * templates across generate() calls; reset() restarts the cyclical and
     * combinatorial sequences (and the random sequence when seeded).
     * Not thread-safe: give each thread its own generator.
     */
    class generator {
        public:
            explicit generator(const wildcard_resolver& resolver,
                               generation_options options = {});
            ~generator();

            generator(const generator&) = delete;
            generator& operator =(const generator&) = delete;

            // Exactly `count` outputs, or fewer when a combinatorial run exhausts
            // its result space
            std::vector<std::string> generate(const command& root, std::size_t count);

            // The text is parsed once per generator, so cyclical positions
            // carry over between calls with the same text
            std::vector<std::string> generate(std::string_view text, std::size_t count);

            void reset();

            [[nodiscard]] const generation_options& options() const { return m_options; }
            [[nodiscard]] const cyclical_state& positions() const { return m_cyclical; }

            // Parsed form of a template (input text or wildcard candidate), cached by text
            const command& parsed(const std::string& text);

        private:
            const wildcard_resolver& m_resolver;
            generation_options m_options;
            std::shared_ptr<const parser> m_parser;
            cyclical_state m_cyclical;
            std::mt19937_64 m_rng;
            std::unordered_map<std::string, command> m_parsed;

            // Combinatorial sub-trees met inside random or cyclical runs
            std::unordered_map<node_id, choice_path> m_sub_paths;

            void seed_engine();

            friend class renderer;
    };

    // One-shot generation with a fresh engine (fresh cyclical positions)
    std::vector<std::string> generate(const command& root, sampling_method method,
                                      const wildcard_resolver& resolver, std::size_t count);

    std::vector<std::string> generate(std::string_view text, sampling_method method,
                                      const wildcard_resolver& resolver, std::size_t count);
}
