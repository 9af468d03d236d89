#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace imagescout::infrastructure {

namespace fs = std::filesystem;

namespace {

fs::path EnsureDir(const fs::path& base) {
    std::error_code ec;
    fs::create_directories(base, ec);
    if (ec) {
        std::cerr << "[PathUtils] Cannot create " << base << ": " << ec.message() << std::endl;
    }
    return base;
}

} // namespace

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetCacheHome() {
    const char* xdgCacheHome = std::getenv("XDG_CACHE_HOME");
    if (xdgCacheHome && *xdgCacheHome) {
        return fs::path(xdgCacheHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".cache";
    }
    return fs::current_path();
}

fs::path PathUtils::GetConfigDir() {
    return EnsureDir(GetConfigHome() / "ImageScout");
}

fs::path PathUtils::GetEmbeddingsDir() {
    return EnsureDir(GetCacheHome() / "ImageScout" / "embeddings");
}

} // namespace imagescout::infrastructure
