//
// Counting and unranking of k-combinations
//

#pragma once

#include <cstddef>
#include <vector>

namespace promptgen::detail {
    // C(n, k), saturating at SIZE_MAX instead of overflowing
    std::size_t binomial(std::size_t n, std::size_t k);

    // a + b, saturating at SIZE_MAX
    std::size_t saturating_add(std::size_t a, std::size_t b);

    // The `rank`-th k-subset of {0 .. n-1} in lexicographic order, ascending
    std::vector<std::size_t> unrank_combination(std::size_t n, std::size_t k, std::size_t rank);
}
