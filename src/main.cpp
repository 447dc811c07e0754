#include "config.hpp"
#include "devserver.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <cstring>
#include <pthread.h>

int main() {
    // Block the shutdown signals before any thread starts so only sigwait sees them
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (int err = pthread_sigmask(SIG_BLOCK, &signals, nullptr); err != 0) {
        spdlog::error("Cannot block shutdown signals: {}", std::strerror(err));
        return 1;
    }

    ServerConfig config;
    try {
        config = LoadConfig();
    } catch (const std::exception &e) {
        spdlog::error("Configuration error: {}", e.what());
        return 1;
    }

    DevServer server(config);
    if (!server.Start()) {
        return 1;
    }

    int sig = 0;
    int status = 0;
    if (int err = sigwait(&signals, &sig); err != 0) {
        spdlog::error("sigwait failed: {}", std::strerror(err));
        status = 1;
    } else {
        spdlog::debug("Received signal {}", sig);
    }

    spdlog::info("Shutting down dev server...");
    server.Stop();
    return status;
}
