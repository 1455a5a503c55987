//
// Owns an open remote session and closes it exactly once when it goes out of scope
//

#ifndef TELESTORE_RELAY_SCOPEDSESSION_H
#define TELESTORE_RELAY_SCOPEDSESSION_H

#include "../Interfaces/IRemoteStore.h"
#include "../Lib/GeneralUtils.h"
#include <iostream>
#include <memory>
#include <utility>

class ScopedSession {
public:
    explicit ScopedSession(std::unique_ptr<IRemoteSession> session) : session(std::move(session)) {}

    ~ScopedSession()
    {
        if (!session)
        {
            return;
        }

        try
        {
            session->close();
        }
        catch (std::exception& e)
        {
            std::cerr << "Session: Failed to close remote session" << std::endl;
            dumpExceptions(e);
        }
    }

    ScopedSession(ScopedSession const&) = delete;
    auto operator=(ScopedSession const&) -> ScopedSession& = delete;
    ScopedSession(ScopedSession&&) = delete;
    auto operator=(ScopedSession&&) -> ScopedSession& = delete;

    auto operator->() const -> IRemoteSession* { return session.get(); }

private:
    std::unique_ptr<IRemoteSession> session;
};

#endif //TELESTORE_RELAY_SCOPEDSESSION_H
