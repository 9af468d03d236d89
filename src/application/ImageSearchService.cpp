/**
 * @file ImageSearchService.cpp
 * @brief Implementation of ImageSearchService.
 */

#include "application/ImageSearchService.hpp"
#include "application/SimilaritySearchEngine.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace imagescout::application {

ImageSearchService::ImageSearchService(std::shared_ptr<domain::EmbeddingService> embedder,
                                       std::shared_ptr<domain::ImageScanner> scanner,
                                       std::shared_ptr<EmbeddingCacheManager> cache,
                                       std::shared_ptr<AsyncTaskManager> tasks,
                                       domain::SearchOptions options)
    : m_embedder(std::move(embedder)),
      m_scanner(std::move(scanner)),
      m_cache(std::move(cache)),
      m_tasks(std::move(tasks)),
      m_options(options),
      m_snapshot(std::make_shared<const domain::EmbeddingCollection>()) {}

ImageSearchService::~ImageSearchService() {
    for (auto& status : m_tasks->GetActiveTasks()) {
        status->cancelRequested = true;
    }
    m_tasks->WaitAll();
}

std::shared_ptr<TaskStatus> ImageSearchService::openFolder(const std::string& folder,
                                                           domain::ProgressCallback onProgress) {
    const std::string folderKey = EmbeddingCacheManager::normalizeFolder(folder);
    auto cached = m_cache->load(folderKey);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_folder = folderKey;
        m_snapshot = std::make_shared<const domain::EmbeddingCollection>(std::move(cached));
        m_lastReport.reset();
    }
    return startReconciliation(folderKey, std::move(onProgress));
}

std::shared_ptr<TaskStatus> ImageSearchService::refresh(domain::ProgressCallback onProgress) {
    std::string folderKey = activeFolder();
    if (folderKey.empty()) return nullptr;
    return startReconciliation(folderKey, std::move(onProgress));
}

std::shared_ptr<TaskStatus> ImageSearchService::startReconciliation(const std::string& folderKey,
                                                                    domain::ProgressCallback onProgress) {
    return m_tasks->SubmitTask(TaskType::Reconciliation, "Indexing " + folderKey,
        [this, folderKey, onProgress](std::shared_ptr<TaskStatus> status) {
            auto tracker = [&status, &onProgress](const domain::ProgressEvent& event) {
                if (event.total > 0) {
                    status->progress = static_cast<float>(event.completed) / static_cast<float>(event.total);
                }
                if (onProgress) onProgress(event);
            };

            auto outcome = m_cache->reconcile(folderKey, *m_scanner, *m_embedder, tracker, &status->cancelRequested);
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_folder == folderKey) {
                    m_lastReport = outcome.report;
                }
            }
            publish(folderKey, std::move(outcome.collection));
        });
}

void ImageSearchService::publish(const std::string& folderKey, domain::EmbeddingCollection collection) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_folder != folderKey) {
        return; // user switched folders meanwhile
    }
    m_snapshot = std::make_shared<const domain::EmbeddingCollection>(std::move(collection));
}

domain::SearchResult ImageSearchService::query(const std::string& text) {
    bool blank = std::all_of(text.begin(), text.end(), [](unsigned char c){ return std::isspace(c); });
    auto current = snapshot();
    if (blank || current->empty()) {
        return {};
    }
    auto queryEmbedding = m_embedder->embedText(text);
    return SimilaritySearchEngine::search(queryEmbedding, *current, m_options);
}

domain::SearchResult ImageSearchService::queryVector(const domain::Embedding& queryEmbedding) const {
    return SimilaritySearchEngine::search(queryEmbedding, *snapshot(), m_options);
}

bool ImageSearchService::imageRenamed(const std::string& oldPath, const std::string& newPath) {
    std::string folderKey = activeFolder();
    if (folderKey.empty()) return false;

    auto identities = m_scanner->scan(folderKey);
    auto it = std::find_if(identities.begin(), identities.end(),
                           [&newPath](const domain::ImageIdentity& id) { return id.path == newPath; });
    if (it == identities.end()) {
        std::cerr << "[ImageSearchService] Renamed image not found in folder: " << newPath << std::endl;
        return false;
    }
    if (!m_cache->relocate(folderKey, oldPath, *it)) {
        return false;
    }
    publish(folderKey, m_cache->load(folderKey));
    return true;
}

bool ImageSearchService::imageDeleted(const std::string& path) {
    std::string folderKey = activeFolder();
    if (folderKey.empty()) return false;
    if (!m_cache->evict(folderKey, path)) {
        return false;
    }
    publish(folderKey, m_cache->load(folderKey));
    return true;
}

std::shared_ptr<const domain::EmbeddingCollection> ImageSearchService::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_snapshot;
}

std::optional<domain::ReconcileReport> ImageSearchService::lastReport() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastReport;
}

std::string ImageSearchService::activeFolder() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_folder;
}

} // namespace imagescout::application
