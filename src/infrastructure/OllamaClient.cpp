#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <iostream>

namespace regionwalker::infrastructure {

using json = nlohmann::json;

namespace {
// Summaries of long notes on a CPU-only box can take minutes.
constexpr int kChatReadTimeoutSeconds = 600;
constexpr int kEmbeddingReadTimeoutSeconds = 180;
constexpr int kConnectTimeoutSeconds = 5;
}

OllamaClient::OllamaClient(const std::string& host, int port)
    : m_host(host), m_port(port) {}

std::optional<json> OllamaClient::postJson(const char* path, const json& body,
                                           int readTimeoutSeconds, const char* what) const {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(kConnectTimeoutSeconds);
    cli.set_read_timeout(readTimeoutSeconds);

    auto res = cli.Post(path, body.dump(), "application/json");
    if (!res) {
        std::cerr << "[OllamaClient] " << what << " request to " << m_host << ":" << m_port
                  << " failed (error " << static_cast<int>(res.error()) << ")" << std::endl;
        return std::nullopt;
    }
    if (res->status != 200) {
        std::cerr << "[OllamaClient] " << what << " HTTP " << res->status << ": " << res->body << std::endl;
        return std::nullopt;
    }

    json reply = json::parse(res->body, nullptr, false);
    if (reply.is_discarded()) {
        std::cerr << "[OllamaClient] " << what << " reply is not JSON" << std::endl;
        return std::nullopt;
    }
    return reply;
}

std::optional<std::string> OllamaClient::chat(const std::string& model,
                                              const nlohmann::json& messages,
                                              const ChatOptions& options) {
    const json request = {
        {"model", model},
        {"messages", messages},
        {"stream", false},
        {"options", {
            {"temperature", options.temperature},
            {"num_predict", options.numPredict}
        }}
    };

    auto reply = postJson("/api/chat", request, kChatReadTimeoutSeconds, "Chat");
    if (!reply) return std::nullopt;

    const auto message = reply->find("message");
    if (message == reply->end() || !message->is_object() || !message->contains("content") ||
        !(*message)["content"].is_string()) {
        std::cerr << "[OllamaClient] Chat reply without message content" << std::endl;
        return std::nullopt;
    }
    return (*message)["content"].get<std::string>();
}

std::optional<std::vector<float>> OllamaClient::getEmbedding(const std::string& model, const std::string& text) {
    const json request = {
        {"model", model},
        {"prompt", text}
    };

    auto reply = postJson("/api/embeddings", request, kEmbeddingReadTimeoutSeconds, "Embedding");
    if (!reply) return std::nullopt;

    try {
        if (reply->contains("embedding") && (*reply)["embedding"].is_array()) {
            auto vec = (*reply)["embedding"].get<std::vector<float>>();
            if (!vec.empty()) return vec;
        }
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] Embedding has non-numeric entries: " << e.what() << std::endl;
        return std::nullopt;
    }
    std::cerr << "[OllamaClient] Embedding reply without a vector" << std::endl;
    return std::nullopt;
}

} // namespace regionwalker::infrastructure
