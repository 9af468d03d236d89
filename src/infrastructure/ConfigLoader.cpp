/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/PathUtils.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

namespace imagescout::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

const char* FingerprintName(FingerprintMode mode) {
    return mode == FingerprintMode::ContentHash ? "content_hash" : "size_mtime";
}

} // namespace

void Settings::validate() const {
    if (maxResults == 0) {
        throw domain::ConfigError("max_results must be greater than 0");
    }
    if (minScore && (*minScore < -1.0f || *minScore > 1.0f)) {
        throw domain::ConfigError("min_score must lie in [-1, 1], got " + std::to_string(*minScore));
    }
    if (supportedExtensions.empty()) {
        throw domain::ConfigError("supported_extensions must not be empty");
    }
    for (const auto& ext : supportedExtensions) {
        if (ext.size() < 2 || ext.front() != '.') {
            throw domain::ConfigError("Invalid extension '" + ext + "', expected a form like '.jpg'");
        }
    }
    if (inferenceHost.empty()) {
        throw domain::ConfigError("inference_host must not be empty");
    }
    if (inferencePort <= 0 || inferencePort > 65535) {
        throw domain::ConfigError("inference_port out of range: " + std::to_string(inferencePort));
    }
}

fs::path Settings::resolvedCacheDirectory() const {
    if (!cacheDirectory.empty()) return fs::path(cacheDirectory);
    return PathUtils::GetEmbeddingsDir();
}

Settings ConfigLoader::FromJson(const json& j) {
    if (!j.is_object()) {
        throw domain::ConfigError("settings.json must contain an object");
    }

    Settings s;
    try {
        s.imageFolder = j.value("image_folder", s.imageFolder);
        if (j.contains("max_results")) {
            long long maxResults = j["max_results"].get<long long>();
            if (maxResults <= 0) {
                throw domain::ConfigError("max_results must be greater than 0");
            }
            s.maxResults = static_cast<std::size_t>(maxResults);
        }
        if (j.contains("min_score") && !j["min_score"].is_null()) {
            s.minScore = j["min_score"].get<float>();
        }
        if (j.contains("supported_extensions")) {
            s.supportedExtensions.clear();
            for (const auto& ext : j["supported_extensions"]) {
                s.supportedExtensions.insert(ToLower(ext.get<std::string>()));
            }
        }
        if (j.contains("fingerprint")) {
            std::string mode = j["fingerprint"].get<std::string>();
            if (mode == "size_mtime") {
                s.fingerprint = FingerprintMode::SizeAndMtime;
            } else if (mode == "content_hash") {
                s.fingerprint = FingerprintMode::ContentHash;
            } else {
                throw domain::ConfigError("Unknown fingerprint mode '" + mode + "'");
            }
        }
        s.cacheDirectory = j.value("cache_directory", s.cacheDirectory);
        s.inferenceHost = j.value("inference_host", s.inferenceHost);
        s.inferencePort = j.value("inference_port", s.inferencePort);
    } catch (const json::exception& e) {
        throw domain::ConfigError(std::string("Invalid settings.json value: ") + e.what());
    }

    s.validate();
    return s;
}

Settings ConfigLoader::Load(const fs::path& configDir) {
    fs::path configPath = configDir / kFileName;
    if (!fs::exists(configPath)) {
        return Settings{};
    }

    json j;
    try {
        std::ifstream f(configPath);
        f >> j;
    } catch (const json::exception& e) {
        throw domain::ConfigError("Cannot parse " + configPath.string() + ": " + e.what());
    }
    return FromJson(j);
}

json ConfigLoader::ReadExisting(const fs::path& configPath) {
    json j = json::object();
    if (!fs::exists(configPath)) return j;

    try {
        std::ifstream f(configPath);
        f >> j;
    } catch (const json::exception& e) {
        std::cerr << "[ConfigLoader] Overwriting unreadable " << configPath << ": " << e.what() << std::endl;
        j = json::object();
    }
    if (!j.is_object()) j = json::object();
    return j;
}

bool ConfigLoader::Write(const fs::path& configPath, const json& j) {
    std::error_code ec;
    fs::create_directories(configPath.parent_path(), ec);

    std::ofstream f(configPath);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Error writing " << configPath << std::endl;
        return false;
    }
    f << j.dump(4);
    return !f.fail();
}

bool ConfigLoader::Save(const fs::path& configDir, const Settings& settings) {
    fs::path configPath = configDir / kFileName;
    json j = ReadExisting(configPath);

    j["image_folder"] = settings.imageFolder;
    j["max_results"] = settings.maxResults;
    if (settings.minScore) {
        j["min_score"] = *settings.minScore;
    } else {
        j.erase("min_score");
    }
    j["supported_extensions"] = settings.supportedExtensions;
    j["fingerprint"] = FingerprintName(settings.fingerprint);
    j["cache_directory"] = settings.cacheDirectory;
    j["inference_host"] = settings.inferenceHost;
    j["inference_port"] = settings.inferencePort;

    return Write(configPath, j);
}

bool ConfigLoader::SaveImageFolder(const fs::path& configDir, const std::string& folder) {
    fs::path configPath = configDir / kFileName;
    json j = ReadExisting(configPath);
    j["image_folder"] = folder;
    return Write(configPath, j);
}

} // namespace imagescout::infrastructure
