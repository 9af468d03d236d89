// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace imagescout::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetCacheHome();
    static std::filesystem::path GetConfigDir();
    static std::filesystem::path GetEmbeddingsDir();
};

} // namespace imagescout::infrastructure
