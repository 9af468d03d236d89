/**
 * @file FileSystemImageScanner.cpp
 * @brief Implementation of the FileSystemImageScanner.
 */

#include "infrastructure/FileSystemImageScanner.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Fnv1a.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace imagescout::infrastructure {

FileSystemImageScanner::FileSystemImageScanner(std::set<std::string> extensions, FingerprintMode mode)
    : m_extensions(std::move(extensions)), m_mode(mode) {}

bool FileSystemImageScanner::isSupported(const std::string& path) const {
    std::string ext = fs::path(path).extension().string();
    // Convert extension to lowercase for robust check
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
    return m_extensions.count(ext) > 0;
}

std::set<domain::ImageIdentity> FileSystemImageScanner::scan(const std::string& folder) {
    std::set<domain::ImageIdentity> identities;

    std::error_code ec;
    fs::path root = fs::absolute(folder, ec).lexically_normal();
    if (ec || !fs::is_directory(root, ec)) {
        return identities;
    }

    fs::directory_iterator it(root, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        std::error_code fileEc;
        if (!entry.is_regular_file(fileEc) || !isSupported(entry.path().string())) {
            continue;
        }
        try {
            identities.insert({entry.path().string(), fingerprint(entry.path().string())});
        } catch (const std::exception& e) {
            // File vanished or became unreadable between listing and fingerprinting.
            std::cerr << "[FileSystemImageScanner] Skipping " << entry.path() << ": " << e.what() << std::endl;
        }
    }
    if (ec) {
        std::cerr << "[FileSystemImageScanner] Error listing " << root << ": " << ec.message() << std::endl;
    }

    return identities;
}

std::string FileSystemImageScanner::fingerprint(const std::string& path) const {
    if (m_mode == FingerprintMode::ContentHash) {
        return calculateHash(path);
    }

    auto size = fs::file_size(path);
    auto ftime = fs::last_write_time(path);
    std::stringstream ss;
    ss << size << "_" << ftime.time_since_epoch().count();
    return ss.str();
}

std::string FileSystemImageScanner::calculateHash(const std::string& filePath) const {
    std::ifstream in(filePath, std::ios::binary);
    if (!in.is_open()) {
        throw domain::IOFailure("Cannot open " + filePath);
    }

    std::uint64_t h = kFnvOffsetBasis;
    std::uintmax_t size = 0;
    char buffer[64 * 1024];
    while (in.read(buffer, sizeof(buffer)) || in.gcount() > 0) {
        auto n = static_cast<std::size_t>(in.gcount());
        h = Fnv1aUpdate(h, buffer, n);
        size += n;
    }
    if (in.bad()) {
        throw domain::IOFailure("Cannot read " + filePath);
    }

    std::stringstream ss;
    ss << "h" << size << "_" << std::hex << std::setw(16) << std::setfill('0') << h;
    return ss.str();
}

} // namespace imagescout::infrastructure
