/**
 * @file EmbeddingCollection.hpp
 * @brief Per-folder mapping from image identity to embedding.
 */

#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "domain/ImageIdentity.hpp"

namespace imagescout::domain {

/** @brief Fixed-length vector in the shared image/text space. */
using Embedding = std::vector<float>;

/**
 * @class EmbeddingCollection
 * @brief Embeddings of one folder's images, plus the schema they were stored with.
 *
 * Entries are keyed by absolute path; each keeps the fingerprint of the
 * content version that was embedded. All vectors share one dimensionality,
 * fixed by the first insert (or by the loaded file).
 */
class EmbeddingCollection {
public:
    static constexpr int kSchemaVersion = 1;

    struct Entry {
        std::string fingerprint;
        Embedding vector;

        bool operator==(const Entry& other) const {
            return fingerprint == other.fingerprint && vector == other.vector;
        }
    };

    EmbeddingCollection() = default;
    explicit EmbeddingCollection(std::string folder, std::size_t dimension = 0,
                                 int schemaVersion = kSchemaVersion);

    const std::string& folder() const { return m_folder; }
    int schemaVersion() const { return m_schemaVersion; }
    std::size_t dimension() const { return m_dimension; }

    /**
     * @brief Inserts or replaces the entry for identity.path.
     * @throws DimensionMismatchError if the vector length differs from dimension().
     */
    void put(const ImageIdentity& identity, Embedding vector);

    /** @brief Removes the entry for a path. Returns false if it was absent. */
    bool remove(const std::string& path);

    /**
     * @brief Moves an entry to a new path/fingerprint, keeping its vector.
     * @return false if oldPath is not cached.
     */
    bool relocate(const std::string& oldPath, const ImageIdentity& newIdentity);

    /** @brief Retrieves an embedding if the fingerprint matches. */
    std::optional<Embedding> get(const ImageIdentity& identity) const;

    /** @brief Identity currently cached for a path, if any. */
    std::optional<ImageIdentity> identityOf(const std::string& path) const;

    bool contains(const ImageIdentity& identity) const;

    std::set<ImageIdentity> identities() const;
    const std::map<std::string, Entry>& entries() const { return m_entries; }

    std::size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    bool operator==(const EmbeddingCollection& other) const;
    bool operator!=(const EmbeddingCollection& other) const { return !(*this == other); }

private:
    std::string m_folder;
    std::size_t m_dimension = 0;
    int m_schemaVersion = kSchemaVersion;
    std::map<std::string, Entry> m_entries;
};

} // namespace imagescout::domain
