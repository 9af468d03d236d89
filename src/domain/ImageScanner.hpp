/**
 * @file ImageScanner.hpp
 * @brief Interface for enumerating the images of a folder.
 */

#pragma once
#include <set>
#include <string>
#include "domain/ImageIdentity.hpp"

namespace imagescout::domain {

/**
 * @class ImageScanner
 * @brief Produces the identity of every supported image in a folder.
 *
 * Each call rescans, so the result is always finite and can be requested again.
 */
class ImageScanner {
public:
    virtual ~ImageScanner() = default;

    /**
     * @brief Scans a folder.
     * @param folder Folder to enumerate.
     * @return Identities of the supported images found (empty if the folder is missing).
     */
    virtual std::set<ImageIdentity> scan(const std::string& folder) = 0;
};

} // namespace imagescout::domain
