#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "domain/Errors.hpp"
#include "infrastructure/ClipServerAdapter.hpp"

using namespace imagescout;
using infrastructure::ClipServerAdapter;
using json = nlohmann::json;

namespace {

template <typename F>
bool failsWithInference(F&& f) {
    try {
        f();
    } catch (const domain::ModelInferenceError& e) {
        std::cout << "  rejected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

json embeddingOf(int dim, float fill) {
    return {{"embedding", std::vector<float>(static_cast<std::size_t>(dim), fill)}};
}

} // namespace

int main() {
    std::cout << "[Test] Starting ClipServerAdapter Test..." << std::endl;

    std::atomic<int> modelDim{4};
    std::atomic<bool> infoAvailable{true};
    std::atomic<bool> broken{false};

    httplib::Server server;
    server.Get("/info", [&](const httplib::Request&, httplib::Response& res) {
        if (!infoAvailable) {
            res.status = 404;
            return;
        }
        res.set_content(json{{"dimension", modelDim.load()}}.dump(), "application/json");
    });
    server.Post("/embed/image", [&](const httplib::Request& req, httplib::Response& res) {
        if (broken) {
            res.set_content("{\"embedding\": ", "application/json");
            return;
        }
        if (req.body == "not an image") {
            res.status = 422;
            res.set_content("cannot identify image file", "text/plain");
            return;
        }
        res.set_content(embeddingOf(modelDim, static_cast<float>(req.body.size())).dump(), "application/json");
    });
    server.Post("/embed/text", [&](const httplib::Request& req, httplib::Response& res) {
        auto text = json::parse(req.body).at("text").get<std::string>();
        res.set_content(embeddingOf(modelDim, static_cast<float>(text.size())).dump(), "application/json");
    });

    int port = server.bind_to_any_port("127.0.0.1");
    assert(port > 0);
    std::thread serverThread([&server] { server.listen_after_bind(); });
    while (!server.is_running()) std::this_thread::sleep_for(std::chrono::milliseconds(1));

    // Dimension known up front from /info
    ClipServerAdapter adapter("127.0.0.1", port);
    adapter.initialize();
    assert(adapter.dimension() == 4);
    auto image = adapter.embedImage({'p', 'n', 'g'});
    assert(image.size() == 4 && image[0] == 3.0f);
    auto text = adapter.embedText("a dog");
    assert(text.size() == 4 && text[0] == 5.0f);
    std::cout << "[PASS] Embedding over HTTP." << std::endl;

    // Without /info the dimension is learned from responses, and follows a model swap
    infoAvailable = false;
    ClipServerAdapter noInfo("127.0.0.1", port);
    noInfo.initialize();
    assert(noInfo.dimension() == 0);
    assert(noInfo.embedText("cat").size() == 4);
    assert(noInfo.dimension() == 4);
    modelDim = 6;
    assert(noInfo.embedImage({'x'}).size() == 6);
    assert(noInfo.dimension() == 6);
    assert(adapter.embedText("again").size() == 6);
    assert(adapter.dimension() == 6);
    std::cout << "[PASS] Dimension tracks the served model." << std::endl;

    // Failures surface as inference errors
    assert(failsWithInference([&] { adapter.embedImage({}); }));
    std::string rejected = "not an image";
    assert(failsWithInference([&] {
        adapter.embedImage(std::vector<unsigned char>(rejected.begin(), rejected.end()));
    }));
    broken = true;
    assert(failsWithInference([&] { adapter.embedImage({'x'}); }));

    server.stop();
    serverThread.join();
    assert(failsWithInference([&] { adapter.embedText("nobody home"); }));
    std::cout << "[PASS] Inference errors." << std::endl;

    std::cout << "[PASS] ClipServerAdapter Test." << std::endl;
    return 0;
}
