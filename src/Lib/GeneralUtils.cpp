#include "GeneralUtils.h"
#include "segvcatch.h"
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <execinfo.h>
#include <folly/experimental/exception_tracer/ExceptionTracer.h>
#include <folly/experimental/exception_tracer/StackTrace.h>
#include <iostream>
#include <string>
#include <thread>
#include <unistd.h>

auto generateUUID() -> std::string
{
    auto uuid = boost::uuids::random_generator()();
    return boost::uuids::to_string(uuid);
}

void dumpExceptions(const std::exception& exception)
{
    std::cerr << "--- Exception: " << exception.what() << '\n';
    auto exceptions = folly::exception_tracer::getCurrentExceptions();
    for (auto& exc : exceptions)
    {
        std::cerr << exc << "\n";
    }
}

void handleSegv()
{
    // NOLINTBEGIN
    void* array[10];
    int size;

    // get void*'s for all entries on the stack
    size = backtrace(array, 10);

    // print out all the frames to stderr
    fprintf(stderr, "Error: SEGFAULT:\n");
    backtrace_symbols_fd(array, size, STDERR_FILENO);

    throw std::runtime_error("Seg Fault Error");
    // NOLINTEND
}

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
auto acceptingConnections(uint16_t port) -> bool
{
    using boost::asio::io_context, boost::asio::ip::tcp;
    using ec = boost::system::error_code;

    bool result = false;

    for (auto counter = 0; counter < 10 && !result; counter++)
    {
        io_context svc;
        tcp::socket socket(svc);
        boost::asio::steady_timer tim(svc, std::chrono::milliseconds(100));

        tim.async_wait([&](ec) { socket.cancel(); });
        socket.async_connect({boost::asio::ip::make_address("127.0.0.1"), port}, [&](ec errorCode) {
            result = !errorCode;
        });

        svc.run();

        if (!result)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    return result;
}
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

// To prevent the compiler optimizing away the exception tracing from folly, we need to reference it.
extern "C" auto getCaughtExceptionStackTraceStack() -> const folly::exception_tracer::StackTrace*;
extern "C" auto getUncaughtExceptionStackTraceStack() -> const folly::exception_tracer::StackTraceStack*;

// Never called, only referenced so the linker keeps folly's exception tracer hooks
void forceExceptionStackTraceRef()
{
    getCaughtExceptionStackTraceStack();
    getUncaughtExceptionStackTraceStack();
}

// Used as the initializer of bForceStartup, which guarantees the crash handler is installed during program startup
auto forceStartup() -> bool
{
    segvcatch::init_segv(&handleSegv);
    return true;
}

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables,cert-err58-cpp)
volatile bool bForceStartup = forceStartup();
