// Shared fixtures for the ImageScout test executables.
#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <vector>
#include "domain/EmbeddingService.hpp"
#include "domain/Errors.hpp"

namespace imagescout::test {

/**
 * Deterministic embedder: the vector is derived from the input bytes, so
 * equal content always yields equal vectors. Inputs starting with "BAD"
 * fail like an undecodable image.
 */
class StubEmbeddingService : public domain::EmbeddingService {
public:
    explicit StubEmbeddingService(std::size_t dim = 4) : m_dim(dim) {}

    domain::Embedding embedImage(const std::vector<unsigned char>& bytes) override {
        ++imageCalls;
        if (bytes.size() >= 3 && bytes[0] == 'B' && bytes[1] == 'A' && bytes[2] == 'D') {
            throw domain::ModelInferenceError("cannot identify image file");
        }
        return derive(std::string(bytes.begin(), bytes.end()));
    }

    domain::Embedding embedText(const std::string& text) override {
        ++textCalls;
        return derive(text);
    }

    std::size_t dimension() const override { return m_dim; }

    domain::Embedding derive(const std::string& data) const {
        domain::Embedding v(m_dim, 1.0f);
        for (std::size_t i = 0; i < data.size(); ++i) {
            v[i % m_dim] += static_cast<float>(static_cast<unsigned char>(data[i]) % 17);
        }
        return v;
    }

    std::atomic<int> imageCalls{0};
    std::atomic<int> textCalls{0};

private:
    std::size_t m_dim;
};

/** Scratch directory removed on destruction. */
class ScratchDir {
public:
    explicit ScratchDir(const std::string& name)
        : m_path(std::filesystem::absolute(std::filesystem::temp_directory_path() / name).lexically_normal()) {
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    const std::filesystem::path& path() const { return m_path; }

    std::string write(const std::string& relative, const std::string& content) const {
        auto file = m_path / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out << content;
        return file.string();
    }

private:
    std::filesystem::path m_path;
};

} // namespace imagescout::test
