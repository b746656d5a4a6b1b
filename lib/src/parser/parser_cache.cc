//
// Parser Cache
//
// One compiled parser per distinct grammar configuration, shared by every
// caller that asks for the same delimiters. Entries are held strongly; once
// the cache is full the least recently requested entry is evicted. The
// default configuration is never evicted.
//

#include <promptgen/parser.hh>

#include <cstdint>
#include <mutex>
#include <unordered_map>

namespace promptgen {
    namespace {
        struct cache_entry {
            std::shared_ptr <const parser> compiled;
            std::uint64_t last_use = 0;
        };

        struct parser_cache {
            std::mutex lock;
            std::uint64_t clock = 0;
            std::unordered_map <grammar_config, cache_entry, grammar_config_hash> entries;

            void evict_one() {
                auto victim = entries.end();
                for (auto it = entries.begin(); it != entries.end(); ++it) {
                    if (it->first == default_grammar_config()) {
                        continue;
                    }
                    if (victim == entries.end() || it->second.last_use < victim->second.last_use) {
                        victim = it;
                    }
                }
                if (victim != entries.end()) {
                    entries.erase(victim);
                }
            }
        };

        parser_cache& cache() {
            static parser_cache instance;
            return instance;
        }
    }

    std::shared_ptr <const parser> get_parser(const grammar_config& config) {
        auto& c = cache();
        std::lock_guard <std::mutex> guard(c.lock);

        if (auto it = c.entries.find(config); it != c.entries.end()) {
            it->second.last_use = ++c.clock;
            return it->second.compiled;
        }

        // Construction validates the configuration; nothing is cached on failure
        auto created = std::make_shared <const parser>(config);
        if (c.entries.size() >= parser_cache_capacity) {
            c.evict_one();
        }
        c.entries.emplace(config, cache_entry{created, ++c.clock});
        return created;
    }

    std::size_t parser_cache_size() {
        auto& c = cache();
        std::lock_guard <std::mutex> guard(c.lock);
        return c.entries.size();
    }
}
