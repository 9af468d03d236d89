#include <iostream>
#include <memory>
#include <string>

#include "application/AsyncTaskManager.hpp"
#include "application/EmbeddingCacheManager.hpp"
#include "application/ImageSearchService.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ClipServerAdapter.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileSystemImageScanner.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace imagescout;

static const char* USAGE = "imagescout [folder] [query words...]\n";

int main(int argc, char** argv) {
    auto configDir = infrastructure::PathUtils::GetConfigDir();

    infrastructure::Settings settings;
    try {
        settings = infrastructure::ConfigLoader::Load(configDir);
    } catch (const domain::ConfigError& e) {
        std::cerr << "[ImageScout] " << e.what() << std::endl;
        return 2;
    }

    std::string folder = argc >= 2 ? argv[1] : settings.imageFolder;
    if (folder.empty()) {
        std::cerr << USAGE;
        return 1;
    }
    std::string query;
    for (int i = 2; i < argc; ++i) {
        if (!query.empty()) query += " ";
        query += argv[i];
    }

    auto embedder = std::make_shared<infrastructure::ClipServerAdapter>(settings.inferenceHost, settings.inferencePort);
    embedder->initialize();

    auto scanner = std::make_shared<infrastructure::FileSystemImageScanner>(settings.supportedExtensions,
                                                                          settings.fingerprint);
    auto cache = std::make_shared<application::EmbeddingCacheManager>(settings.resolvedCacheDirectory());
    auto tasks = std::make_shared<application::AsyncTaskManager>();
    application::ImageSearchService service(embedder, scanner, cache, tasks, settings.searchOptions());

    std::shared_ptr<application::TaskStatus> status;
    try {
        status = service.openFolder(folder, [](const domain::ProgressEvent& event) {
            std::cout << "[" << event.completed << "/" << event.total << "] " << event.path;
            if (event.failed) std::cout << "  FAILED: " << event.error;
            std::cout << std::endl;
        });
    } catch (const domain::ImageScoutError& e) {
        std::cerr << "[ImageScout] Cannot open " << folder << ": " << e.what() << std::endl;
        return 1;
    }
    if (!infrastructure::ConfigLoader::SaveImageFolder(configDir, service.activeFolder())) {
        std::cerr << "[ImageScout] Could not remember folder in settings.json" << std::endl;
    }
    tasks->WaitAll();

    if (status->failed) {
        std::cerr << "[ImageScout] Indexing failed: " << status->errorMessage << std::endl;
        return 1;
    }
    if (auto report = service.lastReport()) {
        std::cout << "Indexed " << service.snapshot()->size() << " images ("
                  << report->added << " new, " << report->failures.size() << " failed)" << std::endl;
    }

    if (query.empty()) return 0;

    try {
        auto results = service.query(query);
        for (const auto& hit : results) {
            std::cout << hit.score << "\t" << hit.identity.path << "\n";
        }
        if (results.empty()) std::cout << "No matching images." << std::endl;
    } catch (const domain::ImageScoutError& e) {
        std::cerr << "[ImageScout] Search failed: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
