//
// Sources of wildcard candidate values.
//

#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace promptgen {
    class wildcard_resolver {
        public:
            virtual ~wildcard_resolver() = default;

            // Ordered candidates for a wildcard name; empty when nothing matches
            [[nodiscard]] virtual std::vector<std::string> resolve(const std::string& name) const = 0;
    };

    // Resolver without any wildcards
    class null_wildcard_resolver : public wildcard_resolver {
        public:
            [[nodiscard]] std::vector<std::string> resolve(const std::string& name) const override;
    };

    /**
     * In-memory name -> values table.
     *
     * A name containing `*` is a glob: every entry whose name matches is
     * merged, in name order.
     */
    class memory_wildcard_resolver : public wildcard_resolver {
        public:
            memory_wildcard_resolver() = default;
            explicit memory_wildcard_resolver(std::map<std::string, std::vector<std::string>> entries);

            void add(const std::string& name, std::vector<std::string> values);

            [[nodiscard]] std::vector<std::string> resolve(const std::string& name) const override;

        private:
            std::map<std::string, std::vector<std::string>> m_entries;
    };

    /**
     * Wildcards stored as files under a list of search directories.
     *
     * `colors/warm` resolves to `<dir>/colors/warm.txt` in the first directory
     * that has it; each non-empty line is a candidate, lines starting with `#`
     * are ignored.
     *
     * `.yaml`/`.yml` files hold structured wildcards: nested mapping keys form
     * the name below the file's directory (the file name itself is not part
     * of it), sequences and scalars are the candidates. Structured files are
     * loaded once, at construction; malformed YAML throws std::runtime_error.
     *
     * A `*` in the name matches every wildcard below the directories, merged
     * in name order. Earlier directories shadow later ones.
     */
    class directory_wildcard_resolver : public wildcard_resolver {
        public:
            explicit directory_wildcard_resolver(std::vector<std::filesystem::path> search_paths);

            [[nodiscard]] std::vector<std::string> resolve(const std::string& name) const override;

            [[nodiscard]] const std::vector<std::filesystem::path>& search_paths() const { return m_search_paths; }

        private:
            using structured_wildcards = std::map<std::string, std::vector<std::string>>;

            std::vector<std::filesystem::path> m_search_paths;
            std::vector<structured_wildcards> m_structured;   // Parallel to m_search_paths
    };

    // Shell-style match where `*` spans any run of characters (including `/`)
    [[nodiscard]] bool wildcard_name_matches(const std::string& pattern, const std::string& name);
}
