//
// Counting and unranking of k-combinations
//

#include "generator/combinations.hh"

#include <limits>

namespace promptgen::detail {
    namespace {
        constexpr std::size_t SATURATED = std::numeric_limits<std::size_t>::max();
    }

    std::size_t saturating_add(std::size_t a, std::size_t b) {
        return (a > SATURATED - b) ? SATURATED : a + b;
    }

    std::size_t binomial(std::size_t n, std::size_t k) {
        if (k > n) {
            return 0;
        }
        if (k > n - k) {
            k = n - k;
        }
        std::size_t result = 1;
        for (std::size_t i = 1; i <= k; ++i) {
            // result * (n - k + i) / i stays exact because result == C(n-k+i-1, i-1)
            const std::size_t factor = n - k + i;
            if (result > SATURATED / factor) {
                return SATURATED;
            }
            result = result * factor / i;
        }
        return result;
    }

    std::vector<std::size_t> unrank_combination(std::size_t n, std::size_t k, std::size_t rank) {
        std::vector<std::size_t> picked;
        picked.reserve(k);

        std::size_t next = 0;
        for (std::size_t slot = 0; slot < k; ++slot) {
            for (std::size_t x = next; x < n; ++x) {
                // Subsets whose element at `slot` is x
                const std::size_t with_x = binomial(n - x - 1, k - slot - 1);
                if (rank < with_x) {
                    picked.push_back(x);
                    next = x + 1;
                    break;
                }
                rank -= with_x;
            }
        }
        return picked;
    }
}
