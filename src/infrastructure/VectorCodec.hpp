/**
 * @file VectorCodec.hpp
 * @brief Durable, atomic storage of an EmbeddingCollection.
 */

#pragma once
#include <filesystem>
#include "domain/EmbeddingCollection.hpp"

namespace imagescout::infrastructure {

/**
 * @class VectorCodec
 * @brief Reads and writes the per-folder cache file.
 *
 * The payload is a CBOR document carrying a format tag, the schema version,
 * the dimensionality, the source folder and every (path, fingerprint, vector)
 * entry. Writes go to a temporary sibling that is renamed over the
 * destination, so a crash leaves either the old or the new file.
 */
class VectorCodec {
public:
    static constexpr const char* kFormatTag = "imagescout.embeddings";

    /**
     * @brief Saves a collection.
     * @throws domain::IOFailure if the destination cannot be written.
     */
    static void save(const domain::EmbeddingCollection& collection, const std::filesystem::path& destination);

    /**
     * @brief Loads a previously saved collection.
     * @throws domain::NotFoundError if no file exists.
     * @throws domain::IOFailure if the file cannot be read.
     * @throws domain::CorruptCacheError on undecodable payload, unknown schema or inconsistent dimensions.
     */
    static domain::EmbeddingCollection load(const std::filesystem::path& source);
};

} // namespace imagescout::infrastructure
