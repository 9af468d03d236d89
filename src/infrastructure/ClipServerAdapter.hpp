/**
 * @file ClipServerAdapter.hpp
 * @brief Adapter for communication with an external CLIP inference server.
 */

#pragma once
#include "domain/EmbeddingService.hpp"
#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

namespace imagescout::infrastructure {

/**
 * @class ClipServerAdapter
 * @brief Implements EmbeddingService over a small REST API.
 *
 * Endpoints: GET /info -> {"dimension": N}; POST /embed/image with the raw
 * image bytes and POST /embed/text with {"text": ...}, both answering
 * {"embedding": [...]}.
 */
class ClipServerAdapter : public domain::EmbeddingService {
public:
    /**
     * @brief Constructor for ClipServerAdapter.
     * @param host Server hostname or IP.
     * @param port Server port.
     */
    ClipServerAdapter(const std::string& host = "localhost", int port = 8765);

    /** @brief Asks /info for the model dimension. Failure is logged, not fatal. */
    void initialize() override;

    /** @brief Embeds image bytes. @see domain::EmbeddingService::embedImage */
    domain::Embedding embedImage(const std::vector<unsigned char>& bytes) override;

    /** @brief Embeds a query. @see domain::EmbeddingService::embedText */
    domain::Embedding embedText(const std::string& text) override;

    std::size_t dimension() const override { return m_dimension.load(); }

private:
    domain::Embedding post(const std::string& route, const std::string& body, const std::string& contentType);
    static domain::Embedding parseEmbedding(const std::string& body);

    std::string m_host; ///< Inference server host.
    int m_port;         ///< Inference server port.
    std::atomic<std::size_t> m_dimension{0};
};

} // namespace imagescout::infrastructure
