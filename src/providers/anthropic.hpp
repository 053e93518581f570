#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace sandlot {

// Anthropic Messages API with native tool_use blocks.
class AnthropicProvider : public Provider {
public:
    AnthropicProvider(const std::string& api_key, HttpClient& http,
                      const std::string& base_url);

    ChatResponse chat(const std::vector<ChatMessage>& messages,
                      const std::vector<ToolSpec>& tools,
                      const std::string& model,
                      double temperature) override;

    std::string provider_name() const override { return "anthropic"; }

    nlohmann::json build_request(const std::vector<ChatMessage>& messages,
                                 const std::vector<ToolSpec>& tools,
                                 const std::string& model,
                                 double temperature) const;

private:
    static ChatResponse parse_response(const std::string& body, const std::string& model);
    static bool is_retryable(long status_code);
    static void backoff_sleep(uint32_t attempt);

    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
    static constexpr const char* API_VERSION = "2023-06-01";
    static constexpr uint32_t MAX_RETRIES = 2;
    static constexpr double INITIAL_DELAY_S = 0.5;
    static constexpr double MAX_DELAY_S = 8.0;
};

} // namespace sandlot
