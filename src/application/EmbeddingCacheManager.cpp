/**
 * @file EmbeddingCacheManager.cpp
 * @brief Implementation of EmbeddingCacheManager.
 */

#include "application/EmbeddingCacheManager.hpp"
#include "application/StalenessDetector.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Fnv1a.hpp"
#include "infrastructure/VectorCodec.hpp"
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>

namespace fs = std::filesystem;

namespace imagescout::application {

EmbeddingCacheManager::EmbeddingCacheManager(fs::path cacheDirectory)
    : m_cacheDirectory(std::move(cacheDirectory)) {}

std::string EmbeddingCacheManager::normalizeFolder(const std::string& folder) {
    fs::path p = fs::absolute(fs::path(folder)).lexically_normal();
    std::string key = p.string();
    while (key.size() > 1 && (key.back() == '/' || key.back() == '\\')) {
        key.pop_back();
    }
    return key;
}

fs::path EmbeddingCacheManager::cacheFileFor(const std::string& folder) const {
    std::uint64_t h = infrastructure::Fnv1a(normalizeFolder(folder));
    std::stringstream name;
    name << std::hex << std::setw(16) << std::setfill('0') << h << ".cbor";
    return m_cacheDirectory / name.str();
}

std::mutex& EmbeddingCacheManager::folderLock(const std::string& folderKey) {
    std::lock_guard<std::mutex> lock(m_registryMutex);
    auto& slot = m_folderLocks[folderKey];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

domain::EmbeddingCollection EmbeddingCacheManager::loadOrEmpty(const std::string& folderKey, bool& reset) const {
    reset = false;
    fs::path file = cacheFileFor(folderKey);
    try {
        auto collection = infrastructure::VectorCodec::load(file);
        if (collection.folder() == folderKey) {
            return collection;
        }
        std::cerr << "[EmbeddingCacheManager] Cache " << file << " belongs to " << collection.folder()
                  << ", ignoring it." << std::endl;
        reset = true;
    } catch (const domain::NotFoundError&) {
        // First run for this folder.
    } catch (const domain::CorruptCacheError& e) {
        std::cerr << "[EmbeddingCacheManager] Ignoring unusable cache: " << e.what() << std::endl;
        reset = true;
    }
    return domain::EmbeddingCollection(folderKey);
}

std::vector<unsigned char> EmbeddingCacheManager::readImageBytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw domain::IOFailure("Cannot open image: " + path);
    }
    std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw domain::IOFailure("Cannot read image: " + path);
    }
    return bytes;
}

EmbeddingCacheManager::Outcome EmbeddingCacheManager::reconcile(const std::string& folder,
                                                                domain::ImageScanner& scanner,
                                                                domain::EmbeddingService& embedder,
                                                                const domain::ProgressCallback& onProgress,
                                                                const std::atomic<bool>* cancel) {
    const std::string folderKey = normalizeFolder(folder);
    std::lock_guard<std::mutex> guard(folderLock(folderKey));

    Outcome outcome;
    domain::ReconcileReport& report = outcome.report;
    domain::EmbeddingCollection collection = loadOrEmpty(folderKey, report.cacheReset);

    std::size_t modelDim = embedder.dimension();
    if (modelDim != 0 && collection.dimension() != 0 && modelDim != collection.dimension()) {
        std::cerr << "[EmbeddingCacheManager] Cache dimension " << collection.dimension()
                  << " does not match model dimension " << modelDim << ", re-embedding " << folderKey << std::endl;
        collection = domain::EmbeddingCollection(folderKey);
        report.cacheReset = true;
    }

    const auto current = scanner.scan(folderKey);
    CacheDelta delta;
    bool restart = true;
    std::size_t carried = 0; // embedded before a restart, counted as added
    while (restart) {
        restart = false;
        delta = StalenessDetector::diff(current, collection);
        report.unchanged = delta.unchanged.size() - carried;
        report.added = carried;
        report.failures.clear();

        const std::size_t total = delta.toAdd.size();
        std::size_t completed = 0;
        for (const auto& identity : delta.toAdd) {
            if (cancel && cancel->load()) {
                report.cancelled = true;
                break;
            }

            domain::ProgressEvent event;
            event.total = total;
            event.path = identity.path;

            try {
                auto bytes = readImageBytes(identity.path);
                ++report.embedderCalls;
                auto vector = embedder.embedImage(bytes);
                if (!report.cacheReset && collection.dimension() != 0 && vector.size() != collection.dimension()) {
                    // Model changed without announcing its dimension: nothing cached is comparable any more.
                    std::cerr << "[EmbeddingCacheManager] Model now yields " << vector.size()
                              << "-dimensional vectors, cache holds " << collection.dimension()
                              << ", re-embedding " << folderKey << std::endl;
                    collection = domain::EmbeddingCollection(folderKey);
                    report.cacheReset = true;
                    restart = true;
                    carried = 1;
                }
                collection.put(identity, std::move(vector));
                ++report.added;
            } catch (const std::exception& e) {
                // A changed image keeps no stale vector for its new content.
                collection.remove(identity.path);
                report.failures.push_back({identity.path, e.what()});
                event.failed = true;
                event.error = e.what();
                std::cerr << "[EmbeddingCacheManager] Skipping " << identity.path << ": " << e.what() << std::endl;
            }

            event.completed = ++completed;
            if (onProgress) onProgress(event);
            if (restart) break;
        }
    }

    if (report.cancelled) {
        // Changed images not reached keep no vector of their old content.
        for (const auto& identity : delta.toAdd) {
            auto cached = collection.identityOf(identity.path);
            if (cached && cached->fingerprint != identity.fingerprint) {
                collection.remove(identity.path);
            }
        }
    }

    for (const auto& identity : delta.toRemove) {
        if (collection.remove(identity.path)) ++report.removed;
    }

    infrastructure::VectorCodec::save(collection, cacheFileFor(folderKey));

    std::cout << "[EmbeddingCacheManager] " << folderKey << ": " << report.added << " embedded, "
              << report.removed << " removed, " << report.unchanged << " unchanged, "
              << report.failures.size() << " failed" << (report.cancelled ? " (cancelled)" : "") << std::endl;

    outcome.collection = std::move(collection);
    return outcome;
}

domain::EmbeddingCollection EmbeddingCacheManager::load(const std::string& folder) {
    const std::string folderKey = normalizeFolder(folder);
    std::lock_guard<std::mutex> guard(folderLock(folderKey));
    bool reset = false;
    return loadOrEmpty(folderKey, reset);
}

bool EmbeddingCacheManager::relocate(const std::string& folder, const std::string& oldPath,
                                     const domain::ImageIdentity& renamed) {
    const std::string folderKey = normalizeFolder(folder);
    std::lock_guard<std::mutex> guard(folderLock(folderKey));
    bool reset = false;
    auto collection = loadOrEmpty(folderKey, reset);
    if (!collection.relocate(oldPath, renamed)) {
        return false;
    }
    infrastructure::VectorCodec::save(collection, cacheFileFor(folderKey));
    return true;
}

bool EmbeddingCacheManager::evict(const std::string& folder, const std::string& path) {
    const std::string folderKey = normalizeFolder(folder);
    std::lock_guard<std::mutex> guard(folderLock(folderKey));
    bool reset = false;
    auto collection = loadOrEmpty(folderKey, reset);
    if (!collection.remove(path)) {
        return false;
    }
    infrastructure::VectorCodec::save(collection, cacheFileFor(folderKey));
    return true;
}

} // namespace imagescout::application
