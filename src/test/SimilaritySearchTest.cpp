#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

#include "application/SimilaritySearchEngine.hpp"
#include "domain/Errors.hpp"

using namespace imagescout;
using application::SimilaritySearchEngine;

namespace {

// Unit vector at the given angle (radians) in the plane.
domain::Embedding atAngle(double radians) {
    return {static_cast<float>(std::cos(radians)), static_cast<float>(std::sin(radians))};
}

bool near(float a, float b) { return std::fabs(a - b) < 1e-5f; }

} // namespace

int main() {
    std::cout << "[Test] Starting SimilaritySearch Test..." << std::endl;

    // Ten images whose cosine with the x axis is known
    domain::EmbeddingCollection collection("/gallery");
    const double step = 0.3;
    for (int i = 0; i < 10; ++i) {
        // Magnitude must not matter
        auto v = atAngle(step * i);
        for (auto& x : v) x *= static_cast<float>(1 + i);
        collection.put({"/gallery/img" + std::to_string(i) + ".jpg", std::to_string(i)}, v);
    }
    domain::Embedding query{2.0f, 0.0f};

    auto all = SimilaritySearchEngine::search(query, collection);
    assert(all.size() == 10);
    for (std::size_t i = 0; i < all.size(); ++i) {
        assert(all[i].identity.path == "/gallery/img" + std::to_string(i) + ".jpg");
        assert(near(all[i].score, static_cast<float>(std::cos(step * i))));
    }

    // Threshold first, then top-K
    domain::SearchOptions options;
    options.topK = 3;
    options.minScore = 0.2f;
    auto top = SimilaritySearchEngine::search(query, collection, options);
    assert(top.size() == 3);
    for (std::size_t i = 0; i < top.size(); ++i) {
        assert(top[i].score >= 0.2f);
        if (i > 0) assert(top[i - 1].score >= top[i].score);
    }

    domain::SearchOptions strict;
    strict.minScore = 0.2f;
    auto thresholded = SimilaritySearchEngine::search(query, collection, strict);
    // cos(0.3 * i) >= 0.2 for i <= 4 only
    assert(thresholded.size() == 5);

    domain::SearchOptions none;
    none.topK = 0;
    assert(SimilaritySearchEngine::search(query, collection, none).empty());

    // Determinism and tie-breaking by path
    domain::EmbeddingCollection ties("/ties");
    ties.put({"/ties/c.jpg", "1"}, {1.0f, 1.0f});
    ties.put({"/ties/a.jpg", "1"}, {2.0f, 2.0f});
    ties.put({"/ties/b.jpg", "1"}, {0.5f, 0.5f});
    ties.put({"/ties/z.jpg", "1"}, {0.0f, 1.0f});
    domain::Embedding diagonal{1.0f, 1.0f};
    auto first = SimilaritySearchEngine::search(diagonal, ties);
    assert(first.size() == 4);
    assert(first[0].identity.path == "/ties/a.jpg");
    assert(first[1].identity.path == "/ties/b.jpg");
    assert(first[2].identity.path == "/ties/c.jpg");
    assert(first[3].identity.path == "/ties/z.jpg");
    for (int run = 0; run < 10; ++run) {
        auto again = SimilaritySearchEngine::search(diagonal, ties);
        assert(again.size() == first.size());
        for (std::size_t i = 0; i < again.size(); ++i) {
            assert(again[i].identity == first[i].identity);
            assert(again[i].score == first[i].score);
        }
    }

    // Dimension mismatch fails the call, leaves the collection alone
    bool threw = false;
    try {
        SimilaritySearchEngine::search({1.0f, 0.0f, 0.0f}, collection);
    } catch (const domain::DimensionMismatchError& e) {
        threw = true;
        assert(e.expected() == 2 && e.actual() == 3);
    }
    assert(threw);
    assert(collection.size() == 10);

    // Empty collection: empty result, whatever the query
    assert(SimilaritySearchEngine::search({1.0f, 2.0f, 3.0f}, domain::EmbeddingCollection("/none")).empty());

    // Zero vectors score 0 instead of dividing by zero
    assert(SimilaritySearchEngine::cosineSimilarity({0.0f, 0.0f}, {1.0f, 0.0f}) == 0.0f);
    assert(near(SimilaritySearchEngine::cosineSimilarity({1.0f, 0.0f}, {-3.0f, 0.0f}), -1.0f));

    std::cout << "[PASS] SimilaritySearch Test." << std::endl;
    return 0;
}
