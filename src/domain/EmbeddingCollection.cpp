/**
 * @file EmbeddingCollection.cpp
 * @brief Implementation of EmbeddingCollection.
 */

#include "domain/EmbeddingCollection.hpp"
#include "domain/Errors.hpp"
#include <utility>

namespace imagescout::domain {

EmbeddingCollection::EmbeddingCollection(std::string folder, std::size_t dimension, int schemaVersion)
    : m_folder(std::move(folder)), m_dimension(dimension), m_schemaVersion(schemaVersion) {}

void EmbeddingCollection::put(const ImageIdentity& identity, Embedding vector) {
    if (vector.empty()) {
        throw DimensionMismatchError(m_dimension, 0);
    }
    if (m_dimension == 0) {
        m_dimension = vector.size();
    } else if (vector.size() != m_dimension) {
        throw DimensionMismatchError(m_dimension, vector.size());
    }
    m_entries[identity.path] = Entry{identity.fingerprint, std::move(vector)};
}

bool EmbeddingCollection::remove(const std::string& path) {
    return m_entries.erase(path) > 0;
}

bool EmbeddingCollection::relocate(const std::string& oldPath, const ImageIdentity& newIdentity) {
    auto it = m_entries.find(oldPath);
    if (it == m_entries.end()) return false;

    Entry moved{newIdentity.fingerprint, std::move(it->second.vector)};
    m_entries.erase(it);
    m_entries[newIdentity.path] = std::move(moved);
    return true;
}

std::optional<Embedding> EmbeddingCollection::get(const ImageIdentity& identity) const {
    auto it = m_entries.find(identity.path);
    if (it != m_entries.end() && it->second.fingerprint == identity.fingerprint) {
        return it->second.vector;
    }
    return std::nullopt;
}

std::optional<ImageIdentity> EmbeddingCollection::identityOf(const std::string& path) const {
    auto it = m_entries.find(path);
    if (it == m_entries.end()) return std::nullopt;
    return ImageIdentity{it->first, it->second.fingerprint};
}

bool EmbeddingCollection::contains(const ImageIdentity& identity) const {
    auto it = m_entries.find(identity.path);
    return it != m_entries.end() && it->second.fingerprint == identity.fingerprint;
}

std::set<ImageIdentity> EmbeddingCollection::identities() const {
    std::set<ImageIdentity> result;
    for (const auto& [path, entry] : m_entries) {
        result.insert(ImageIdentity{path, entry.fingerprint});
    }
    return result;
}

bool EmbeddingCollection::operator==(const EmbeddingCollection& other) const {
    return m_folder == other.m_folder &&
           m_dimension == other.m_dimension &&
           m_schemaVersion == other.m_schemaVersion &&
           m_entries == other.m_entries;
}

} // namespace imagescout::domain
