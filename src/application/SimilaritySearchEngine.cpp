/**
 * @file SimilaritySearchEngine.cpp
 * @brief Implementation of SimilaritySearchEngine.
 */

#include "application/SimilaritySearchEngine.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cmath>

namespace imagescout::application {

float SimilaritySearchEngine::cosineSimilarity(const domain::Embedding& v1, const domain::Embedding& v2) {
    if (v1.size() != v2.size()) {
        throw domain::DimensionMismatchError(v1.size(), v2.size());
    }
    double dot = 0, n1 = 0, n2 = 0;
    for (std::size_t i = 0; i < v1.size(); ++i) {
        dot += static_cast<double>(v1[i]) * v2[i];
        n1 += static_cast<double>(v1[i]) * v1[i];
        n2 += static_cast<double>(v2[i]) * v2[i];
    }
    double norm = std::sqrt(n1) * std::sqrt(n2);
    return (norm > 0) ? static_cast<float>(dot / norm) : 0.0f;
}

domain::SearchResult SimilaritySearchEngine::search(const domain::Embedding& query,
                                                    const domain::EmbeddingCollection& collection,
                                                    const domain::SearchOptions& options) {
    domain::SearchResult hits;
    if (collection.empty()) return hits;

    if (query.size() != collection.dimension()) {
        throw domain::DimensionMismatchError(collection.dimension(), query.size());
    }

    hits.reserve(collection.size());
    for (const auto& [path, entry] : collection.entries()) {
        float score = cosineSimilarity(query, entry.vector);
        if (options.minScore && score < *options.minScore) continue;
        hits.push_back({domain::ImageIdentity{path, entry.fingerprint}, score});
    }

    // Sort by score descending, path ascending on ties
    std::sort(hits.begin(), hits.end(), [](const auto& a, const auto& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.identity.path < b.identity.path;
    });

    if (options.topK && hits.size() > *options.topK) {
        hits.resize(*options.topK);
    }
    return hits;
}

} // namespace imagescout::application
