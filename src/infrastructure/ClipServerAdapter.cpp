/**
 * @file ClipServerAdapter.cpp
 * @brief Implementation of ClipServerAdapter.
 */

#include "infrastructure/ClipServerAdapter.hpp"
#include "domain/Errors.hpp"
#include <httplib.h>
#include <iostream>
#include <nlohmann/json.hpp>

namespace imagescout::infrastructure {

using json = nlohmann::json;

namespace {
constexpr int kInfoTimeoutSec = 5;
constexpr int kEmbedTimeoutSec = 180; // first call may load the model
}

ClipServerAdapter::ClipServerAdapter(const std::string& host, int port)
    : m_host(host), m_port(port) {}

void ClipServerAdapter::initialize() {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(kInfoTimeoutSec);

    auto res = cli.Get("/info");
    if (!res || res->status != 200) {
        std::cerr << "[ClipServerAdapter] Inference server not reachable at " << m_host << ":" << m_port << std::endl;
        return;
    }
    try {
        auto body = json::parse(res->body);
        if (body.contains("dimension")) {
            m_dimension = body["dimension"].get<std::size_t>();
        }
    } catch (const json::exception& e) {
        std::cerr << "[ClipServerAdapter] Invalid /info response: " << e.what() << std::endl;
    }
}

domain::Embedding ClipServerAdapter::embedImage(const std::vector<unsigned char>& bytes) {
    if (bytes.empty()) {
        throw domain::ModelInferenceError("Empty image");
    }
    std::string body(bytes.begin(), bytes.end());
    return post("/embed/image", body, "application/octet-stream");
}

domain::Embedding ClipServerAdapter::embedText(const std::string& text) {
    json requestData = {{"text", text}};
    return post("/embed/text", requestData.dump(), "application/json");
}

domain::Embedding ClipServerAdapter::post(const std::string& route, const std::string& body,
                                          const std::string& contentType) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(kEmbedTimeoutSec);

    auto res = cli.Post(route, body, contentType);
    if (!res) {
        throw domain::ModelInferenceError("Connection to " + m_host + ":" + std::to_string(m_port) +
                                          " failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw domain::ModelInferenceError("HTTP " + std::to_string(res->status) + " from " + route + ": " + res->body);
    }

    auto embedding = parseEmbedding(res->body);
    std::size_t previous = m_dimension.exchange(embedding.size());
    if (previous != 0 && previous != embedding.size()) {
        std::cerr << "[ClipServerAdapter] Model dimension changed from " << previous
                  << " to " << embedding.size() << std::endl;
    }
    return embedding;
}

domain::Embedding ClipServerAdapter::parseEmbedding(const std::string& body) {
    try {
        auto parsed = json::parse(body);
        if (parsed.contains("embedding") && parsed["embedding"].is_array() && !parsed["embedding"].empty()) {
            return parsed["embedding"].get<domain::Embedding>();
        }
    } catch (const json::exception& e) {
        throw domain::ModelInferenceError(std::string("Malformed embedding response: ") + e.what());
    }
    throw domain::ModelInferenceError("Response carries no embedding");
}

} // namespace imagescout::infrastructure
