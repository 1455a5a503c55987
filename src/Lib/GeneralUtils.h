//
// Small helpers shared by every part of the relay
//

#ifndef TELESTORE_RELAY_GENERALUTILS_H
#define TELESTORE_RELAY_GENERALUTILS_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

auto generateUUID() -> std::string;
void dumpExceptions(const std::exception& exception);
void handleSegv();
auto acceptingConnections(uint16_t port) -> bool;

struct InterruptableTimer {
    // Returns false if killed
    template<class R, class P>
    auto wait_for(std::chrono::duration<R, P> const& time) const -> bool
    {
        std::unique_lock<std::mutex> lock(m);
        return !cv.wait_for(lock, time, [&] { return terminate; });
    }

    void stop()
    {
        std::unique_lock<std::mutex> const lock(m);
        terminate = true;
        cv.notify_all();
    }

private:
    mutable std::condition_variable cv;
    mutable std::mutex m;
    bool terminate = false;
};

#endif //TELESTORE_RELAY_GENERALUTILS_H
