#include "Credentials.h"

namespace {
auto getField(const nlohmann::json& payload, const std::string& name) -> std::string
{
    if (!payload.contains(name))
    {
        return {};
    }

    const auto& value = payload[name];
    if (value.is_string())
    {
        return value.get<std::string>();
    }

    if (value.is_number())
    {
        return value.dump();
    }

    return {};
}
} // namespace

sCredentials::sCredentials(const nlohmann::json& payload)
{
    if (!payload.is_object())
    {
        return;
    }

    botToken = getField(payload, "bot_token");
    channelId = getField(payload, "channel_id");
    session = getField(payload, "telegram_session");
    apiId = getField(payload, "telegram_api_id");
    apiHash = getField(payload, "telegram_api_hash");
    userId = getField(payload, "user_id");
}

auto sCredentials::hasSmallObjectCredentials() const -> bool
{
    return !botToken.empty() && !channelId.empty();
}

auto sCredentials::missingSessionFields() const -> std::vector<std::string>
{
    std::vector<std::string> missing;

    if (session.empty())
    {
        missing.emplace_back("telegram_session");
    }

    if (apiId.empty())
    {
        missing.emplace_back("telegram_api_id");
    }

    if (apiHash.empty())
    {
        missing.emplace_back("telegram_api_hash");
    }

    if (channelId.empty())
    {
        missing.emplace_back("channel_id");
    }

    return missing;
}
