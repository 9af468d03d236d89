#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

#include "domain/Errors.hpp"
#include "infrastructure/VectorCodec.hpp"
#include "TestSupport.hpp"

using namespace imagescout;
using infrastructure::VectorCodec;
namespace fs = std::filesystem;

namespace {

void writeCbor(const fs::path& file, const nlohmann::json& j) {
    auto bytes = nlohmann::json::to_cbor(j);
    std::ofstream out(file, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

template <typename E, typename F>
bool throwsAs(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[Test] Starting VectorCodec Test..." << std::endl;
    test::ScratchDir scratch("imagescout_codec_test");
    fs::path cacheFile = scratch.path() / "cache" / "photos.cbor";

    // Round trip
    domain::EmbeddingCollection original("/photos");
    original.put({"/photos/a.jpg", "10_1"}, {0.1f, -0.25f, 3.5f});
    original.put({"/photos/b.png", "20_2"}, {1.0f / 3.0f, 0.0f, -7.125f});
    original.put({"/photos/c.gif", "h5_ff"}, {1e-7f, 2e7f, 0.5f});

    VectorCodec::save(original, cacheFile);
    auto loaded = VectorCodec::load(cacheFile);
    assert(loaded == original);
    assert(loaded.dimension() == 3);
    assert(loaded.folder() == "/photos");
    assert(loaded.schemaVersion() == domain::EmbeddingCollection::kSchemaVersion);

    // Overwrite replaces the whole file and leaves no temp files behind
    original.remove("/photos/b.png");
    VectorCodec::save(original, cacheFile);
    assert(VectorCodec::load(cacheFile).size() == 2);
    for (const auto& entry : fs::directory_iterator(cacheFile.parent_path())) {
        assert(entry.path().extension() != ".tmp");
    }

    // Empty collections are valid caches
    VectorCodec::save(domain::EmbeddingCollection("/empty"), scratch.path() / "empty.cbor");
    assert(VectorCodec::load(scratch.path() / "empty.cbor").empty());

    // Missing file
    assert(throwsAs<domain::NotFoundError>([&] { VectorCodec::load(scratch.path() / "missing.cbor"); }));

    // Garbage payload
    fs::path garbage = scratch.path() / "garbage.cbor";
    scratch.write("garbage.cbor", "this is not cbor at all");
    assert(throwsAs<domain::CorruptCacheError>([&] { VectorCodec::load(garbage); }));

    // Unknown schema version
    fs::path future = scratch.path() / "future.cbor";
    writeCbor(future, {
        {"format", VectorCodec::kFormatTag},
        {"schema_version", 99},
        {"dimension", 2},
        {"folder", "/photos"},
        {"entries", nlohmann::json::array()}
    });
    assert(throwsAs<domain::CorruptCacheError>([&] { VectorCodec::load(future); }));

    // Entries disagreeing on dimensionality
    fs::path ragged = scratch.path() / "ragged.cbor";
    writeCbor(ragged, {
        {"format", VectorCodec::kFormatTag},
        {"schema_version", domain::EmbeddingCollection::kSchemaVersion},
        {"dimension", 2},
        {"folder", "/photos"},
        {"entries", {
            {{"path", "/photos/a.jpg"}, {"fingerprint", "1"}, {"vector", {1.0, 2.0}}},
            {{"path", "/photos/b.jpg"}, {"fingerprint", "2"}, {"vector", {1.0, 2.0, 3.0}}}
        }}
    });
    assert(throwsAs<domain::CorruptCacheError>([&] { VectorCodec::load(ragged); }));

    // Unwritable destination: its parent is a regular file
    std::string blocker = scratch.write("blocker", "x");
    assert(throwsAs<domain::IOFailure>([&] { VectorCodec::save(original, fs::path(blocker) / "cache.cbor"); }));

    std::cout << "[PASS] VectorCodec Test." << std::endl;
    return 0;
}
