/**
 * @file ConfigLoader.hpp
 * @brief Loading/saving of application configuration (settings.json).
 *
 * All recognized options live in Settings and are validated once when
 * loaded, so the rest of the code never parses JSON for configuration.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/SearchResult.hpp"
#include "infrastructure/FileSystemImageScanner.hpp"

namespace imagescout::infrastructure {

/**
 * @struct Settings
 * @brief Every option ImageScout reads from settings.json.
 */
struct Settings {
    std::string imageFolder;                 ///< Last opened folder.
    std::size_t maxResults = 50;             ///< Top-K applied to queries.
    std::optional<float> minScore;           ///< Similarity threshold in [-1, 1].
    std::set<std::string> supportedExtensions{".jpg", ".jpeg", ".png", ".gif"};
    FingerprintMode fingerprint = FingerprintMode::SizeAndMtime;
    std::string cacheDirectory;              ///< Empty means PathUtils::GetEmbeddingsDir().
    std::string inferenceHost = "localhost";
    int inferencePort = 8765;

    /** @throws domain::ConfigError on the first invalid value. */
    void validate() const;

    domain::SearchOptions searchOptions() const { return {maxResults, minScore}; }

    /** @brief cacheDirectory, or the XDG default when unset. */
    std::filesystem::path resolvedCacheDirectory() const;
};

class ConfigLoader {
public:
    static constexpr const char* kFileName = "settings.json";

    /**
     * @brief Reads settings.json from configDir.
     * @param configDir Directory holding settings.json.
     * @return Validated settings; defaults if the file does not exist.
     * @throws domain::ConfigError if the file is malformed or holds invalid values.
     */
    static Settings Load(const std::filesystem::path& configDir);

    /** @brief Builds validated settings from a parsed document. */
    static Settings FromJson(const nlohmann::json& j);

    /**
     * @brief Writes settings to settings.json, preserving keys it does not know.
     * @return false if the file could not be written.
     */
    static bool Save(const std::filesystem::path& configDir, const Settings& settings);

    /** @brief Updates only the 'image_folder' key. */
    static bool SaveImageFolder(const std::filesystem::path& configDir, const std::string& folder);

private:
    static nlohmann::json ReadExisting(const std::filesystem::path& configPath);
    static bool Write(const std::filesystem::path& configPath, const nlohmann::json& j);
};

} // namespace imagescout::infrastructure
