/**
 * @file ImageSearchService.hpp
 * @brief Folder session: keeps the active folder's collection current and answers text queries.
 */

#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "application/AsyncTaskManager.hpp"
#include "application/EmbeddingCacheManager.hpp"
#include "domain/EmbeddingService.hpp"
#include "domain/ImageScanner.hpp"
#include "domain/ReconcileReport.hpp"
#include "domain/SearchResult.hpp"

namespace imagescout::application {

/**
 * @class ImageSearchService
 * @brief Entry point for the presentation layer.
 *
 * Queries always run against one immutable snapshot of the active folder's
 * collection; a finished reconciliation swaps in a new snapshot only if its
 * folder is still the active one.
 */
class ImageSearchService {
public:
    ImageSearchService(std::shared_ptr<domain::EmbeddingService> embedder,
                       std::shared_ptr<domain::ImageScanner> scanner,
                       std::shared_ptr<EmbeddingCacheManager> cache,
                       std::shared_ptr<AsyncTaskManager> tasks,
                       domain::SearchOptions options);

    /** @brief Cancels running reconciliations and waits for them. */
    ~ImageSearchService();

    /**
     * @brief Switches to a folder: loads its cache for immediate queries and reconciles in the background.
     * @param folder Folder to open.
     * @param onProgress Receives one event per image embedded (called from the worker thread).
     * @return Status of the background reconciliation.
     */
    std::shared_ptr<TaskStatus> openFolder(const std::string& folder, domain::ProgressCallback onProgress = nullptr);

    /** @brief Reconciles the active folder again. Returns nullptr when no folder is open. */
    std::shared_ptr<TaskStatus> refresh(domain::ProgressCallback onProgress = nullptr);

    /**
     * @brief Ranks the active folder's images against a text description.
     * @return Empty for a blank query or an empty collection (the embedder is not called).
     * @throws domain::ModelInferenceError if the query cannot be embedded.
     */
    domain::SearchResult query(const std::string& text);

    /** @brief Ranks the active folder's images against a precomputed query vector. */
    domain::SearchResult queryVector(const domain::Embedding& queryEmbedding) const;

    /** @brief Keeps the cached vector of an image renamed on disk. */
    bool imageRenamed(const std::string& oldPath, const std::string& newPath);

    /** @brief Forgets an image deleted from disk. */
    bool imageDeleted(const std::string& path);

    std::shared_ptr<const domain::EmbeddingCollection> snapshot() const;
    std::optional<domain::ReconcileReport> lastReport() const;
    std::string activeFolder() const;

private:
    std::shared_ptr<TaskStatus> startReconciliation(const std::string& folderKey, domain::ProgressCallback onProgress);
    void publish(const std::string& folderKey, domain::EmbeddingCollection collection);

    std::shared_ptr<domain::EmbeddingService> m_embedder;
    std::shared_ptr<domain::ImageScanner> m_scanner;
    std::shared_ptr<EmbeddingCacheManager> m_cache;
    std::shared_ptr<AsyncTaskManager> m_tasks;
    domain::SearchOptions m_options;

    mutable std::mutex m_mutex;
    std::string m_folder;
    std::shared_ptr<const domain::EmbeddingCollection> m_snapshot;
    std::optional<domain::ReconcileReport> m_lastReport;
};

} // namespace imagescout::application
