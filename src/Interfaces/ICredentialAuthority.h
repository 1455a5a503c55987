//
// Interface to the credential authority, which owns user accounts and issues remote store credentials
//

#ifndef TELESTORE_RELAY_I_CREDENTIAL_AUTHORITY_H
#define TELESTORE_RELAY_I_CREDENTIAL_AUTHORITY_H

#include "../Remote/Credentials.h"
#include <string>

class ICredentialAuthority {
public:
    virtual ~ICredentialAuthority() = default;

    // Fetches the credentials of the user holding authToken. Throws eCredentialFetchError on any failure
    virtual auto fetchCredentials(const std::string& authToken) -> sCredentials = 0;

    // Verifies a short lived download token. Throws eNotAuthorized if it is invalid or expired
    virtual auto verifyDownloadToken(const std::string& token) -> sCredentials = 0;
};

#endif //TELESTORE_RELAY_I_CREDENTIAL_AUTHORITY_H
