/**
 * @file SimilaritySearchEngine.hpp
 * @brief Exact cosine ranking of a collection against a query vector.
 */

#pragma once
#include "domain/EmbeddingCollection.hpp"
#include "domain/SearchResult.hpp"

namespace imagescout::application {

/**
 * @class SimilaritySearchEngine
 * @brief Stateless linear scan over an EmbeddingCollection.
 */
class SimilaritySearchEngine {
public:
    /**
     * @brief Ranks every image of the collection by cosine similarity to the query.
     * @param query Query embedding, same dimensionality as the collection.
     * @param collection Snapshot to search.
     * @param options Minimum score (applied first) and top-K limit.
     * @return Hits by descending score, ties by ascending path. Empty for an empty collection.
     * @throws domain::DimensionMismatchError if the query length differs from the collection's.
     */
    static domain::SearchResult search(const domain::Embedding& query,
                                       const domain::EmbeddingCollection& collection,
                                       const domain::SearchOptions& options = {});

    /** @brief Cosine similarity; 0 when either vector has zero magnitude. */
    static float cosineSimilarity(const domain::Embedding& v1, const domain::Embedding& v2);
};

} // namespace imagescout::application
