//
// Renderer - walks a command tree and produces one output string
//

#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include <promptgen/command.hh>
#include <promptgen/generator.hh>
#include <promptgen/variable_context.hh>

namespace promptgen {
    /**
     * Renders one output of a generate() run.
     *
     * A renderer is created per output. It holds the active sampling method
     * (changed by per-node overrides for the duration of a sub-tree), the
     * choice path that combinatorial choice points are recorded on, and the
     * stack of partially built strings that make up the ambient text tested
     * by conditions.
     */
    class renderer {
        public:
            static constexpr std::size_t MAX_EXPANSION_DEPTH = 64;

            // `top_path` is the run's odometer when the run is combinatorial, else null
            renderer(generator& owner, sampling_method method, choice_path* top_path);

            std::string render_output(const command& root);

            // Steps every combinatorial sub-tree visited during this output
            void finish();

        private:
            generator& m_owner;
            sampling_method m_method;
            choice_path* m_path;
            std::size_t m_expansion_depth = 0;

            std::vector<const std::string*> m_frames;
            std::vector<choice_path*> m_touched;

            // Cyclical position taken by each node in this output
            std::unordered_map<node_id, std::size_t> m_cyclical_picks;

            class method_scope;
            class expansion_guard;

            void render(const command& cmd, variable_context& ctx, std::string& out);
            std::string render_to_string(const command& cmd, variable_context& ctx);

            void render_variant(const variant_command& cmd, variable_context& ctx, std::string& out);
            void render_wildcard(const wildcard_command& cmd, variable_context& ctx, std::string& out);
            void render_wrap(const wrap_command& cmd, variable_context& ctx, std::string& out);
            void render_probability(const probability_command& cmd, variable_context& ctx, std::string& out);
            void render_condition(const condition_command& cmd, variable_context& ctx, std::string& out);
            void render_access(const variable_access_command& cmd, variable_context& ctx, std::string& out);
            void render_assignment(const variable_assignment_command& cmd, variable_context& ctx);

            // Odometer of a combinatorial sub-tree rooted at `id`, rewound and marked visited
            choice_path& sub_path(node_id id);

            // Picks one of `count` alternatives with uniform weight under the active method
            std::size_t pick(node_id id, std::size_t count);

            // Advances the node's counter on its first visit in this output only;
            // later visits repeat that position
            std::size_t cyclical_position(node_id id, std::size_t count);

            std::string variable_value(const std::string& name, variable_context& ctx);
            std::string ambient_text() const;
    };
}
