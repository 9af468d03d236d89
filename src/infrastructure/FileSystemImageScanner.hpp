/**
 * @file FileSystemImageScanner.hpp
 * @brief Scanner for detecting images in a folder.
 */

#pragma once
#include <set>
#include <string>
#include "domain/ImageScanner.hpp"

namespace imagescout::infrastructure {

/**
 * @enum FingerprintMode
 * @brief How an image's change fingerprint is computed.
 */
enum class FingerprintMode {
    SizeAndMtime, ///< "<size>_<mtime>": no file read, misses same-size edits within one mtime tick.
    ContentHash   ///< Hash of the file bytes: reads every image on each scan.
};

/**
 * @class FileSystemImageScanner
 * @brief Infrastructure adapter listing the supported images of a folder (non-recursive).
 */
class FileSystemImageScanner : public domain::ImageScanner {
public:
    /**
     * @param extensions Lower-case extensions including the dot (".jpg").
     * @param mode Fingerprint strategy.
     */
    FileSystemImageScanner(std::set<std::string> extensions, FingerprintMode mode = FingerprintMode::SizeAndMtime);

    /**
     * @brief Scans for images.
     * @return Identities with absolute paths; empty if the folder does not exist.
     */
    std::set<domain::ImageIdentity> scan(const std::string& folder) override;

    /** @brief Fingerprint of one file under the configured mode. */
    std::string fingerprint(const std::string& path) const;

    /** @brief Whether the file's extension is supported (case-insensitive). */
    bool isSupported(const std::string& path) const;

private:
    std::set<std::string> m_extensions;
    FingerprintMode m_mode;

    std::string calculateHash(const std::string& filePath) const;
};

} // namespace imagescout::infrastructure
