#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>

namespace equilibra::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kDeterministicTemperature = 0.0;
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;
}

OllamaClient::OllamaClient(const std::string& host, int port, int connectTimeoutSeconds, int readTimeoutSeconds)
    : m_host(host), m_port(port), m_connectTimeout(connectTimeoutSeconds), m_readTimeout(readTimeoutSeconds) {}

std::optional<std::string> OllamaClient::generate(const std::string& model,
                                                  const std::string& system,
                                                  const std::string& prompt,
                                                  bool forceJson) {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(m_connectTimeout, 0);
    cli.set_read_timeout(m_readTimeout, 0);
    cli.set_write_timeout(m_readTimeout, 0);

    json requestData = {
        {"model", model},
        {"system", system},
        {"prompt", prompt},
        {"stream", false},
        {"options", {
            {"temperature", kDeterministicTemperature},
            {"top_p", kDeterministicTopP},
            {"seed", kDeterministicSeed}
        }}
    };
    if (forceJson) {
        requestData["format"] = "json";
    }

    auto res = cli.Post("/api/generate", requestData.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("response") && body["response"].is_string()) {
                return body["response"].get<std::string>();
            }
            std::cerr << "[OllamaClient] Response without 'response' field" << std::endl;
        } catch (const json::exception& e) {
            std::cerr << "[OllamaClient] JSON Parse Error: " << e.what() << std::endl;
        }
    } else if (res) {
        std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << res->body << std::endl;
    } else {
        std::cerr << "[OllamaClient] Connection failed: " << static_cast<int>(res.error()) << std::endl;
    }
    return std::nullopt;
}

} // namespace equilibra::infrastructure
