//
// The remote object store, reached through the stateless small object API or a session on the gateway
//

#ifndef TELESTORE_RELAY_REMOTESTORE_H
#define TELESTORE_RELAY_REMOTESTORE_H

#include "../Interfaces/IRemoteStore.h"
#include <string>

class RemoteStore : public IRemoteStore {
public:
    RemoteStore(std::string botApiUrl, std::string gatewayHost);

    auto sendSmallObject(
            const sCredentials& credentials,
            const std::string& path,
            const std::string& fileName
    ) -> sRemoteRecord override;

    auto openSession(const sCredentials& credentials) -> std::unique_ptr<IRemoteSession> override;

private:
    std::string botApiUrl;
    std::string gatewayHost;
};

#endif //TELESTORE_RELAY_REMOTESTORE_H
