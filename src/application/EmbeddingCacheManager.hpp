/**
 * @file EmbeddingCacheManager.hpp
 * @brief Sole owner and writer of the per-folder embedding caches.
 */

#pragma once
#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "domain/EmbeddingCollection.hpp"
#include "domain/EmbeddingService.hpp"
#include "domain/ImageScanner.hpp"
#include "domain/ReconcileReport.hpp"

namespace imagescout::application {

/**
 * @class EmbeddingCacheManager
 * @brief Decides when the embedder runs and keeps each folder's cache file in sync with disk.
 *
 * Every operation on a folder holds that folder's lock, so at most one
 * reconciliation (or maintenance edit) is in flight per folder while
 * different folders proceed independently.
 */
class EmbeddingCacheManager {
public:
    /**
     * @struct Outcome
     * @brief Collection after reconciliation plus what was done to it.
     */
    struct Outcome {
        domain::EmbeddingCollection collection;
        domain::ReconcileReport report;
    };

    /**
     * @param cacheDirectory Directory holding one cache file per folder.
     */
    explicit EmbeddingCacheManager(std::filesystem::path cacheDirectory);

    /**
     * @brief Brings the folder's cache up to date and persists it.
     *
     * Loads the cache (unusable caches count as absent), scans the folder,
     * embeds only new or changed images and drops vanished ones. Images the
     * embedder cannot handle are recorded in the report and skipped. The
     * cancel flag is polled between images; when raised, the work done so far
     * is persisted and the report is marked cancelled.
     *
     * A model whose dimension differs from the cache's invalidates every
     * cached vector, whether it reports dimension() up front or only reveals
     * it with its first embedding; in the latter case progress restarts with
     * a new total.
     *
     * @param folder Folder to reconcile.
     * @param scanner Source of the folder's current identities.
     * @param embedder Model used for new or changed images.
     * @param onProgress Called once per image handed to the embedder.
     * @param cancel Optional cancellation flag.
     * @throws domain::IOFailure if the cache cannot be read or written.
     */
    Outcome reconcile(const std::string& folder,
                      domain::ImageScanner& scanner,
                      domain::EmbeddingService& embedder,
                      const domain::ProgressCallback& onProgress = nullptr,
                      const std::atomic<bool>* cancel = nullptr);

    /** @brief Loads the folder's cache as is; empty when absent or unusable. */
    domain::EmbeddingCollection load(const std::string& folder);

    /**
     * @brief Moves a cached vector after the image was renamed on disk.
     * @return false if the old path was not cached.
     */
    bool relocate(const std::string& folder, const std::string& oldPath, const domain::ImageIdentity& renamed);

    /**
     * @brief Drops the entry of an image deleted from disk.
     * @return false if the path was not cached.
     */
    bool evict(const std::string& folder, const std::string& path);

    /** @brief Cache file used for a folder. */
    std::filesystem::path cacheFileFor(const std::string& folder) const;

    /** @brief Absolute, normalized form used as the folder's key. */
    static std::string normalizeFolder(const std::string& folder);

private:
    std::mutex& folderLock(const std::string& folderKey);
    domain::EmbeddingCollection loadOrEmpty(const std::string& folderKey, bool& reset) const;
    static std::vector<unsigned char> readImageBytes(const std::string& path);

    std::filesystem::path m_cacheDirectory;
    std::mutex m_registryMutex;
    std::map<std::string, std::unique_ptr<std::mutex>> m_folderLocks;
};

} // namespace imagescout::application
