/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <optional>
#include <string>

namespace equilibra::infrastructure {

class OllamaClient {
public:
    /**
     * @param connectTimeoutSeconds Connection timeout.
     * @param readTimeoutSeconds Read/write timeout for a single request.
     */
    OllamaClient(const std::string& host = "localhost", int port = 11434,
                 int connectTimeoutSeconds = 3, int readTimeoutSeconds = 20);

    /** @brief POST /api/generate with deterministic sampling. nullopt on any failure. */
    std::optional<std::string> generate(const std::string& model,
                                        const std::string& system,
                                        const std::string& prompt,
                                        bool forceJson = false);

private:
    std::string m_host;
    int m_port;
    int m_connectTimeout;
    int m_readTimeout;
};

} // namespace equilibra::infrastructure
