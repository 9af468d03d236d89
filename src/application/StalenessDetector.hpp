/**
 * @file StalenessDetector.hpp
 * @brief Computes which images of a folder need (re)embedding.
 */

#pragma once
#include <set>
#include "domain/EmbeddingCollection.hpp"
#include "domain/ImageIdentity.hpp"

namespace imagescout::application {

/**
 * @struct CacheDelta
 * @brief Partition of current and cached identities.
 *
 * toRemove holds the identities as they are cached, so a changed image shows
 * up only in toAdd (with its new fingerprint).
 */
struct CacheDelta {
    std::set<domain::ImageIdentity> toAdd;
    std::set<domain::ImageIdentity> toRemove;
    std::set<domain::ImageIdentity> unchanged;

    bool empty() const { return toAdd.empty() && toRemove.empty(); }
};

/**
 * @class StalenessDetector
 * @brief Pure comparison of a folder scan against a cached collection.
 */
class StalenessDetector {
public:
    /**
     * @brief Diffs current folder contents against the cache.
     * @param current Identities reported by the scanner.
     * @param cached The collection loaded from disk.
     * @return New or changed images in toAdd, vanished images in toRemove, the rest in unchanged.
     */
    static CacheDelta diff(const std::set<domain::ImageIdentity>& current,
                           const domain::EmbeddingCollection& cached);
};

} // namespace imagescout::application
