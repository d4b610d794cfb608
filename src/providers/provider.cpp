#include "superagent/providers/provider.hpp"

#include "superagent/core/logger.hpp"
#include "superagent/core/utils.hpp"
#include "superagent/providers/openai.hpp"

namespace superagent::providers {

auto make_provider(boost::asio::io_context& ioc, const ProviderConfig& config)
    -> Result<std::shared_ptr<Provider>> {
    auto name = utils::to_lower(config.name);
    if (name == "openai" || name == "openai-compatible") {
        if (config.api_key.empty()) {
            LOG_WARN("Provider '{}' has no API key configured", name);
        }
        return std::make_shared<OpenAIProvider>(ioc, config);
    }
    return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                      "Unknown provider", config.name));
}

} // namespace superagent::providers
