/**
 * @file SearchResult.hpp
 * @brief Ranked output of a similarity query.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include "domain/ImageIdentity.hpp"

namespace imagescout::domain {

/**
 * @struct SearchHit
 * @brief One image and its cosine similarity to the query.
 */
struct SearchHit {
    ImageIdentity identity;
    float score = 0.0f;
};

/** @brief Hits ordered by descending score, ties by ascending path. */
using SearchResult = std::vector<SearchHit>;

/**
 * @struct SearchOptions
 * @brief Truncation applied to a ranking: threshold first, then top-K.
 */
struct SearchOptions {
    std::optional<std::size_t> topK;
    std::optional<float> minScore;
};

} // namespace imagescout::domain
