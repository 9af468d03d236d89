/**
 * @file EmbeddingService.hpp
 * @brief Interface for the vision-language model that produces embeddings.
 */

#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "domain/EmbeddingCollection.hpp"

namespace imagescout::domain {

/**
 * @class EmbeddingService
 * @brief Abstract interface for services that map images and text into one embedding space.
 *
 * Implementations hold no state the cache has to manage. Both embed calls
 * throw ModelInferenceError on malformed input or model failure.
 */
class EmbeddingService {
public:
    virtual ~EmbeddingService() = default;

    /** @brief Optional initialization (e.g., connection check, dimension lookup). */
    virtual void initialize() {}

    /**
     * @brief Embeds the encoded bytes of one image file.
     * @param bytes Raw file content (JPEG, PNG, ...).
     * @return The image embedding.
     */
    virtual Embedding embedImage(const std::vector<unsigned char>& bytes) = 0;

    /**
     * @brief Embeds a natural-language query.
     * @param text The query text.
     * @return The text embedding.
     */
    virtual Embedding embedText(const std::string& text) = 0;

    /** @brief Output dimensionality, or 0 while unknown. */
    virtual std::size_t dimension() const { return 0; }
};

} // namespace imagescout::domain
