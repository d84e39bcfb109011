/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace regionwalker::infrastructure {

/**
 * @struct ChatOptions
 * @brief Sampling options forwarded in the "options" object of /api/chat.
 */
struct ChatOptions {
    double temperature = 0.3;
    int numPredict = 300;
};

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434);

    /** @brief Sends a POST request to /api/chat and returns the message content. */
    std::optional<std::string> chat(const std::string& model,
                                    const nlohmann::json& messages,
                                    const ChatOptions& options = ChatOptions{});

    /** @brief Sends a POST request to /api/embeddings. */
    std::optional<std::vector<float>> getEmbedding(const std::string& model, const std::string& text);

    const std::string& host() const { return m_host; }
    int port() const { return m_port; }

private:
    // POSTs body to path; returns the parsed reply of a 200 response, logging everything else.
    std::optional<nlohmann::json> postJson(const char* path, const nlohmann::json& body,
                                           int readTimeoutSeconds, const char* what) const;

    std::string m_host;
    int m_port;
};

} // namespace regionwalker::infrastructure
