//
// Renderer - depth-first, left-to-right walk of a command tree
//

#include "generator/renderer.hh"
#include "generator/combinations.hh"

#include <promptgen/errors.hh>

#include <algorithm>
#include <regex>
#include <string_view>

namespace promptgen {
    namespace {
        // Wrapper substitution point; the earliest of the two spellings wins
        constexpr std::string_view WRAP_MARKER_ASCII = "...";
        constexpr std::string_view WRAP_MARKER_ELLIPSIS = "\xE2\x80\xA6";

        struct marker_position {
            std::size_t offset;
            std::size_t length;
        };

        marker_position find_wrap_marker(const std::string& wrapper) {
            const auto ascii = wrapper.find(WRAP_MARKER_ASCII);
            const auto ellipsis = wrapper.find(WRAP_MARKER_ELLIPSIS);
            if (ascii == std::string::npos && ellipsis == std::string::npos) {
                return {std::string::npos, 0};
            }
            if (ellipsis == std::string::npos || (ascii != std::string::npos && ascii < ellipsis)) {
                return {ascii, WRAP_MARKER_ASCII.size()};
            }
            return {ellipsis, WRAP_MARKER_ELLIPSIS.size()};
        }

        std::string trim(const std::string& text) {
            const auto first = text.find_first_not_of(" \t\r\n");
            if (first == std::string::npos) {
                return {};
            }
            const auto last = text.find_last_not_of(" \t\r\n");
            return text.substr(first, last - first + 1);
        }

        class frame_guard {
            public:
                frame_guard(std::vector<const std::string*>& frames, const std::string& buffer)
                    : m_frames(frames) {
                    m_frames.push_back(&buffer);
                }
                ~frame_guard() { m_frames.pop_back(); }

                frame_guard(const frame_guard&) = delete;
                frame_guard& operator =(const frame_guard&) = delete;

            private:
                std::vector<const std::string*>& m_frames;
        };
    }

    // ========================================================================
    // Scopes
    // ========================================================================

    // Switches the active sampling method for one sub-tree. Entering
    // combinatorial sampling from another method starts recording on the
    // node's own odometer, which advances once per output.
    class renderer::method_scope {
        public:
            method_scope(renderer& r, const std::optional<sampling_method>& method, node_id id)
                : m_renderer(r), m_saved_method(r.m_method), m_saved_path(r.m_path) {
                if (!method || *method == r.m_method) {
                    return;
                }
                r.m_method = *method;
                r.m_path = (*method == sampling_method::combinatorial) ? &r.sub_path(id) : nullptr;
            }

            ~method_scope() {
                m_renderer.m_method = m_saved_method;
                m_renderer.m_path = m_saved_path;
            }

            method_scope(const method_scope&) = delete;
            method_scope& operator =(const method_scope&) = delete;

        private:
            renderer& m_renderer;
            sampling_method m_saved_method;
            choice_path* m_saved_path;
    };

    class renderer::expansion_guard {
        public:
            expansion_guard(renderer& r, const std::string& what)
                : m_renderer(r) {
                if (m_renderer.m_expansion_depth >= MAX_EXPANSION_DEPTH) {
                    throw recursion_limit_error(what, m_renderer.m_expansion_depth);
                }
                ++m_renderer.m_expansion_depth;
            }

            ~expansion_guard() { --m_renderer.m_expansion_depth; }

            expansion_guard(const expansion_guard&) = delete;
            expansion_guard& operator =(const expansion_guard&) = delete;

        private:
            renderer& m_renderer;
    };

    // ========================================================================
    // Entry points
    // ========================================================================

    renderer::renderer(generator& owner, sampling_method method, choice_path* top_path)
        : m_owner(owner), m_method(method), m_path(top_path) {
    }

    std::string renderer::render_output(const command& root) {
        variable_context ctx;
        return render_to_string(root, ctx);
    }

    void renderer::finish() {
        for (auto* path : m_touched) {
            if (!path->advance()) {
                path->reset();
            }
        }
        m_touched.clear();
    }

    choice_path& renderer::sub_path(node_id id) {
        auto& path = m_owner.m_sub_paths[id];
        path.rewind();
        if (std::find(m_touched.begin(), m_touched.end(), &path) == m_touched.end()) {
            m_touched.push_back(&path);
        }
        return path;
    }

    // ========================================================================
    // Dispatch
    // ========================================================================

    std::string renderer::render_to_string(const command& cmd, variable_context& ctx) {
        std::string out;
        frame_guard frame(m_frames, out);
        render(cmd, ctx, out);
        return out;
    }

    void renderer::render(const command& cmd, variable_context& ctx, std::string& out) {
        if (const auto* literal = std::get_if<literal_command>(&cmd.node)) {
            out += literal->text;
        }
        else if (const auto* sequence = std::get_if<sequence_command>(&cmd.node)) {
            for (const auto& child : sequence->children) {
                render(child, ctx, out);
            }
        }
        else if (const auto* variant = std::get_if<variant_command>(&cmd.node)) {
            render_variant(*variant, ctx, out);
        }
        else if (const auto* wildcard = std::get_if<wildcard_command>(&cmd.node)) {
            render_wildcard(*wildcard, ctx, out);
        }
        else if (const auto* wrap = std::get_if<wrap_command>(&cmd.node)) {
            render_wrap(*wrap, ctx, out);
        }
        else if (const auto* probability = std::get_if<probability_command>(&cmd.node)) {
            render_probability(*probability, ctx, out);
        }
        else if (const auto* condition = std::get_if<condition_command>(&cmd.node)) {
            render_condition(*condition, ctx, out);
        }
        else if (const auto* access = std::get_if<variable_access_command>(&cmd.node)) {
            render_access(*access, ctx, out);
        }
        else if (const auto* assignment = std::get_if<variable_assignment_command>(&cmd.node)) {
            render_assignment(*assignment, ctx);
        }
        // comment_command renders nothing
    }

    // ========================================================================
    // Choice points
    // ========================================================================

    std::size_t renderer::pick(node_id id, std::size_t count) {
        switch (m_method) {
            case sampling_method::random: {
                std::uniform_int_distribution<std::size_t> dist(0, count - 1);
                return dist(m_owner.m_rng);
            }
            case sampling_method::combinatorial:
                return m_path->choose(count);
            case sampling_method::cyclical:
                return cyclical_position(id, count);
        }
        return 0;
    }

    std::size_t renderer::cyclical_position(node_id id, std::size_t count) {
        if (auto it = m_cyclical_picks.find(id); it != m_cyclical_picks.end()) {
            return it->second % count;
        }
        const std::size_t position = m_owner.m_cyclical.advance(id, count);
        m_cyclical_picks.emplace(id, position);
        return position;
    }

    void renderer::render_variant(const variant_command& cmd, variable_context& ctx, std::string& out) {
        method_scope scope(*this, cmd.method, cmd.id);

        // Zero-weight options are never produced
        std::vector<std::size_t> eligible;
        for (std::size_t i = 0; i < cmd.options.size(); ++i) {
            if (cmd.options[i].weight > 0.0) {
                eligible.push_back(i);
            }
        }
        if (eligible.empty()) {
            return;
        }

        const std::size_t m = eligible.size();
        std::vector<std::size_t> selected;

        switch (m_method) {
            case sampling_method::random: {
                std::uniform_int_distribution<std::size_t> how_many(cmd.min_bound, cmd.max_bound);
                const std::size_t k = how_many(m_owner.m_rng);

                std::vector<double> weights;
                weights.reserve(m);
                for (auto index : eligible) {
                    weights.push_back(cmd.options[index].weight);
                }
                std::discrete_distribution<std::size_t> draw(weights.begin(), weights.end());
                for (std::size_t j = 0; j < k; ++j) {
                    selected.push_back(eligible[draw(m_owner.m_rng)]);
                }
                break;
            }

            case sampling_method::combinatorial: {
                const std::size_t lo = std::min(cmd.min_bound, m);
                const std::size_t hi = std::min(cmd.max_bound, m);

                std::size_t total = 0;
                for (std::size_t k = lo; k <= hi; ++k) {
                    total = detail::saturating_add(total, detail::binomial(m, k));
                }

                std::size_t rank = m_path->choose(total);
                for (std::size_t k = lo; k <= hi; ++k) {
                    const std::size_t with_k = detail::binomial(m, k);
                    if (rank < with_k) {
                        for (auto position : detail::unrank_combination(m, k, rank)) {
                            selected.push_back(eligible[position]);
                        }
                        break;
                    }
                    rank -= with_k;
                }
                break;
            }

            case sampling_method::cyclical: {
                const std::size_t k = std::min(cmd.min_bound, m);
                const std::size_t start = cyclical_position(cmd.id, m);
                for (std::size_t j = 0; j < k; ++j) {
                    selected.push_back(eligible[(start + j) % m]);
                }
                break;
            }
        }

        for (std::size_t j = 0; j < selected.size(); ++j) {
            if (j > 0) {
                out += cmd.separator;
            }
            render(*cmd.options[selected[j]].value, ctx, out);
        }
    }

    void renderer::render_probability(const probability_command& cmd, variable_context& ctx, std::string& out) {
        method_scope scope(*this, cmd.method, cmd.id);

        bool include = false;
        if (m_method == sampling_method::random) {
            std::uniform_real_distribution<double> dist(0.0, 1.0);
            include = dist(m_owner.m_rng) < cmd.chance;
        } else {
            // Two alternatives, empty then value, minus the one with zero weight
            const bool can_skip = cmd.chance < 1.0;
            const bool can_include = cmd.chance > 0.0;
            if (can_skip && can_include) {
                include = pick(cmd.id, 2) == 1;
            } else {
                include = can_include;
            }
        }

        if (include) {
            render(*cmd.value, ctx, out);
        }
    }

    // ========================================================================
    // Wildcards and wrapping
    // ========================================================================

    void renderer::render_wildcard(const wildcard_command& cmd, variable_context& ctx, std::string& out) {
        method_scope scope(*this, cmd.method, cmd.id);

        const std::string name = cmd.dynamic_name ? trim(render_to_string(*cmd.dynamic_name, ctx)) : cmd.name;
        const auto candidates = m_owner.m_resolver.resolve(name);
        if (candidates.empty()) {
            if (m_owner.m_options.empty_wildcards == empty_wildcard_policy::error) {
                throw unresolved_wildcard_error(name);
            }
            return;
        }

        const std::string& chosen = candidates[pick(cmd.id, candidates.size())];

        expansion_guard guard(*this, "wildcard '" + name + "'");
        variable_context nested(&ctx);
        for (const auto& [variable, value] : cmd.variables) {
            nested.assign(variable, render_to_string(*value, ctx));
        }
        render(m_owner.parsed(chosen), nested, out);
    }

    void renderer::render_wrap(const wrap_command& cmd, variable_context& ctx, std::string& out) {
        const std::string inner = render_to_string(*cmd.inner, ctx);
        const std::string wrapper = render_to_string(*cmd.wrapper, ctx);

        const auto marker = find_wrap_marker(wrapper);
        if (marker.offset == std::string::npos) {
            out += wrapper;
            out += inner;
            return;
        }
        out.append(wrapper, 0, marker.offset);
        out += inner;
        out.append(wrapper, marker.offset + marker.length, std::string::npos);
    }

    // ========================================================================
    // Conditions and variables
    // ========================================================================

    std::string renderer::ambient_text() const {
        std::string text;
        for (const auto* frame : m_frames) {
            text += *frame;
        }
        return text;
    }

    void renderer::render_condition(const condition_command& cmd, variable_context& ctx, std::string& out) {
        for (const auto& arm : cmd.arms) {
            const std::string subject = arm.context_key ? variable_value(*arm.context_key, ctx) : ambient_text();
            if (std::regex_search(subject, arm.matcher)) {
                render(*arm.value, ctx, out);
                return;
            }
        }
        render(*cmd.else_value, ctx, out);
    }

    std::string renderer::variable_value(const std::string& name, variable_context& ctx) {
        const auto* bound = ctx.find(name);
        if (bound == nullptr) {
            return {};
        }
        if (const auto* text = std::get_if<std::string>(bound)) {
            return *text;
        }
        expansion_guard guard(*this, "variable '" + name + "'");
        return render_to_string(*std::get<variable_context::deferred>(*bound), ctx);
    }

    void renderer::render_access(const variable_access_command& cmd, variable_context& ctx, std::string& out) {
        const auto* bound = ctx.find(cmd.name);
        if (bound == nullptr) {
            if (cmd.default_value) {
                render(*cmd.default_value, ctx, out);
            }
            return;
        }
        if (const auto* text = std::get_if<std::string>(bound)) {
            out += *text;
            return;
        }
        // Deferred: rendered again on every access
        const command* value = std::get<variable_context::deferred>(*bound);
        expansion_guard guard(*this, "variable '" + cmd.name + "'");
        render(*value, ctx, out);
    }

    void renderer::render_assignment(const variable_assignment_command& cmd, variable_context& ctx) {
        if (!cmd.overwrite && ctx.contains(cmd.name)) {
            return;
        }
        if (cmd.immediate) {
            ctx.assign(cmd.name, render_to_string(*cmd.value, ctx), cmd.overwrite);
        } else {
            ctx.assign(cmd.name, variable_context::deferred{cmd.value.get()}, cmd.overwrite);
        }
    }
}
