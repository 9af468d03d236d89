/**
 * @file StalenessDetector.cpp
 * @brief Implementation of StalenessDetector.
 */

#include "application/StalenessDetector.hpp"
#include <string>

namespace imagescout::application {

CacheDelta StalenessDetector::diff(const std::set<domain::ImageIdentity>& current,
                                   const domain::EmbeddingCollection& cached) {
    CacheDelta delta;
    std::set<std::string> currentPaths;

    for (const auto& identity : current) {
        currentPaths.insert(identity.path);
        if (cached.contains(identity)) {
            delta.unchanged.insert(identity);
        } else {
            delta.toAdd.insert(identity);
        }
    }

    for (const auto& [path, entry] : cached.entries()) {
        if (currentPaths.count(path) == 0) {
            delta.toRemove.insert(domain::ImageIdentity{path, entry.fingerprint});
        }
    }

    return delta;
}

} // namespace imagescout::application
