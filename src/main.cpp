#include "Application.h"

auto main() -> int
{
    auto app = createApplication();

    // Serve until the HTTP server is stopped
    app->run();

    return 0;
}
