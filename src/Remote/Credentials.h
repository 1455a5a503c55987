//
// Remote store credentials issued per user by the credential authority
//

#ifndef TELESTORE_RELAY_CREDENTIALS_H
#define TELESTORE_RELAY_CREDENTIALS_H

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct sCredentials {
    sCredentials() = default;

    // Decodes the authority's JSON payload, missing or null fields decode as empty
    explicit sCredentials(const nlohmann::json& payload);

    // Key for the stateless small object API
    std::string botToken;

    // Destination channel, numeric but transported as text
    std::string channelId;

    // Persistent session token and the application identifiers it was issued for
    std::string session;
    std::string apiId;
    std::string apiHash;

    // The user these credentials belong to
    std::string userId;

    [[nodiscard]] auto hasSmallObjectCredentials() const -> bool;

    // Names of the fields the session strategy needs but which are empty
    [[nodiscard]] auto missingSessionFields() const -> std::vector<std::string>;
};

#endif //TELESTORE_RELAY_CREDENTIALS_H
