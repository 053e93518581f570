#include "provider.hpp"
#include "providers/anthropic.hpp"
#include <stdexcept>

namespace sandlot {

std::unique_ptr<Provider> create_provider(const std::string& name,
                                          const std::string& api_key,
                                          HttpClient& http,
                                          const std::string& base_url) {
    if (name == "anthropic") {
        return std::make_unique<AnthropicProvider>(api_key, http, base_url);
    }
    throw std::invalid_argument("Unknown provider: " + name);
}

} // namespace sandlot
