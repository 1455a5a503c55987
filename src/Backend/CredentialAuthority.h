//
// Credential authority client, talks to the backend's worker API
//

#ifndef TELESTORE_RELAY_CREDENTIALAUTHORITY_H
#define TELESTORE_RELAY_CREDENTIALAUTHORITY_H

#include "../Interfaces/ICredentialAuthority.h"
#include <string>

class CredentialAuthority : public ICredentialAuthority {
public:
    explicit CredentialAuthority(std::string backendUrl);

    auto fetchCredentials(const std::string& authToken) -> sCredentials override;
    auto verifyDownloadToken(const std::string& token) -> sCredentials override;

private:
    std::string backendUrl;
};

#endif //TELESTORE_RELAY_CREDENTIALAUTHORITY_H
