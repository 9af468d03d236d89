/**
 * @file ImageIdentity.hpp
 * @brief Stable key for one on-disk image version.
 */

#pragma once
#include <string>
#include <tuple>

namespace imagescout::domain {

/**
 * @struct ImageIdentity
 * @brief Absolute path plus a change fingerprint.
 *
 * Two identities with the same path and fingerprint describe the same
 * content. The cache is keyed by path; the fingerprint decides staleness.
 */
struct ImageIdentity {
    std::string path;        ///< Absolute path of the image file.
    std::string fingerprint; ///< "<size>_<mtime>" or a content hash.

    bool operator==(const ImageIdentity& other) const {
        return path == other.path && fingerprint == other.fingerprint;
    }
    bool operator!=(const ImageIdentity& other) const { return !(*this == other); }
    bool operator<(const ImageIdentity& other) const {
        return std::tie(path, fingerprint) < std::tie(other.path, other.fingerprint);
    }
};

} // namespace imagescout::domain
