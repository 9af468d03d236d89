/**
 * @file VectorCodec.cpp
 * @brief Implementation of VectorCodec.
 */

#include "infrastructure/VectorCodec.hpp"
#include "domain/Errors.hpp"
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace imagescout::infrastructure {

namespace {

json encode(const domain::EmbeddingCollection& collection) {
    json entries = json::array();
    for (const auto& [path, entry] : collection.entries()) {
        entries.push_back({
            {"path", path},
            {"fingerprint", entry.fingerprint},
            {"vector", entry.vector}
        });
    }
    return {
        {"format", VectorCodec::kFormatTag},
        {"schema_version", collection.schemaVersion()},
        {"dimension", collection.dimension()},
        {"folder", collection.folder()},
        {"entries", entries}
    };
}

domain::EmbeddingCollection decode(const json& j, const fs::path& source) {
    if (!j.is_object() || j.value("format", std::string()) != VectorCodec::kFormatTag) {
        throw domain::CorruptCacheError("Not an embeddings cache: " + source.string());
    }

    int version = j.at("schema_version").get<int>();
    if (version != domain::EmbeddingCollection::kSchemaVersion) {
        throw domain::CorruptCacheError("Unsupported schema version " + std::to_string(version) +
                                        " in " + source.string());
    }

    std::size_t dimension = j.at("dimension").get<std::size_t>();
    domain::EmbeddingCollection collection(j.at("folder").get<std::string>(), dimension, version);

    const json& entries = j.at("entries");
    if (!entries.is_array()) {
        throw domain::CorruptCacheError("Entries are not a list in " + source.string());
    }
    if (dimension == 0 && !entries.empty()) {
        throw domain::CorruptCacheError("Zero dimension with stored entries in " + source.string());
    }

    for (const auto& item : entries) {
        domain::ImageIdentity identity{item.at("path").get<std::string>(),
                                       item.at("fingerprint").get<std::string>()};
        auto vector = item.at("vector").get<std::vector<float>>();
        if (vector.size() != dimension) {
            throw domain::CorruptCacheError("Entry " + identity.path + " has " + std::to_string(vector.size()) +
                                            " components, expected " + std::to_string(dimension));
        }
        collection.put(identity, std::move(vector));
    }
    return collection;
}

} // namespace

void VectorCodec::save(const domain::EmbeddingCollection& collection, const fs::path& destination) {
    std::vector<std::uint8_t> payload = json::to_cbor(encode(collection));

    // Unique sibling temp file: <destination>.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = destination;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    try {
        if (destination.has_parent_path() && !fs::exists(destination.parent_path())) {
            fs::create_directories(destination.parent_path());
        }
    } catch (const fs::filesystem_error& e) {
        throw domain::IOFailure("Cannot create cache directory: " + std::string(e.what()));
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw domain::IOFailure("Failed to open temp file: " + tempPath.string());
        }
        ofs.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            std::error_code ec;
            fs::remove(tempPath, ec);
            throw domain::IOFailure("Write failed: " + tempPath.string());
        }
    }

    std::error_code ec;
    fs::rename(tempPath, destination, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        throw domain::IOFailure("Rename to " + destination.string() + " failed: " + ec.message());
    }
}

domain::EmbeddingCollection VectorCodec::load(const fs::path& source) {
    std::error_code ec;
    if (!fs::exists(source, ec)) {
        throw domain::NotFoundError("No cache at " + source.string());
    }

    std::ifstream ifs(source, std::ios::binary);
    if (!ifs.is_open()) {
        throw domain::IOFailure("Failed to open cache: " + source.string());
    }
    std::vector<std::uint8_t> payload((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad()) {
        throw domain::IOFailure("Failed to read cache: " + source.string());
    }

    try {
        return decode(json::from_cbor(payload), source);
    } catch (const json::exception& e) {
        throw domain::CorruptCacheError("Undecodable cache " + source.string() + ": " + e.what());
    } catch (const domain::DimensionMismatchError& e) {
        throw domain::CorruptCacheError("Inconsistent cache " + source.string() + ": " + e.what());
    }
}

} // namespace imagescout::infrastructure
