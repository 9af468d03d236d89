/**
 * @file ReconcileReport.hpp
 * @brief Progress events and summary of a cache reconciliation.
 */

#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace imagescout::domain {

/**
 * @struct ProgressEvent
 * @brief Emitted once per image handed to the embedder, successful or not.
 */
struct ProgressEvent {
    std::size_t completed = 0; ///< Items finished so far, including this one.
    std::size_t total = 0;     ///< Items scheduled for embedding.
    std::string path;          ///< Image this event refers to.
    bool failed = false;
    std::string error;         ///< Failure message when failed is set.
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

/**
 * @struct ItemFailure
 * @brief An image that could not be embedded during reconciliation.
 */
struct ItemFailure {
    std::string path;
    std::string reason;
};

/**
 * @struct ReconcileReport
 * @brief What a reconciliation did to the cache.
 */
struct ReconcileReport {
    std::size_t added = 0;     ///< New or changed images embedded.
    std::size_t removed = 0;   ///< Entries dropped because the file is gone.
    std::size_t unchanged = 0; ///< Entries kept without re-embedding.
    std::size_t embedderCalls = 0;
    std::vector<ItemFailure> failures;
    bool cacheReset = false;   ///< Prior cache was unusable and ignored.
    bool cancelled = false;    ///< Stopped early; the processed part was persisted.
};

} // namespace imagescout::domain
