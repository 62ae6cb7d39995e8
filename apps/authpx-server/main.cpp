#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

#include <pthread.h>

#include "authpx/proxy-service.hpp"
#include "pxhttp/log.hpp"

using namespace authpx;
using pxhttp::log;

namespace
{

enum ExitCode {
    EXIT_ORDERLY = 0,
    EXIT_CONFIG = 1,
    EXIT_BIND = 2
};

ProxySettings loadSettings(int argc, char** argv)
{
    std::string path;
    if (argc > 1)
        path = argv[1];
    else if (auto env = std::getenv("AUTHPX_SETTINGS_FILE"))
        path = env;

    auto settings = path.empty() ? ProxySettings() : ProxySettings::fromFile(path);
    settings.applyEnvironment();
    settings.resolveSecrets();
    if (!pxhttp::setLogLevel(settings.logLevel))
        log().warn("Unknown log level '{}', keeping '{}'.",
            settings.logLevel, spdlog::level::to_string_view(log().level()));
    return settings;
}

}

int main(int argc, char** argv)
{
    if (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        std::cout << "Usage: authpx-server [settings.yaml]\n"
                  << "Settings may also be given through AUTHPX_SETTINGS_FILE and environment overrides,\n"
                  << "e.g. ESPLORA_CLIENT_ID, ESPLORA_CLIENT_SECRET, ESPLORA_UPSTREAM, OIDC_TOKEN_URL, BIND.\n";
        return EXIT_ORDERLY;
    }

    // Termination signals are consumed by a dedicated thread, which is
    // the only one that does not block them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    std::unique_ptr<ProxyService> service;
    try {
        service = std::make_unique<ProxyService>(
            loadSettings(argc, argv),
            std::make_unique<pxhttp::HttpLibHttpClient>());
    }
    catch (ConfigError const& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return EXIT_CONFIG;
    }
    catch (pxhttp::URIError const& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return EXIT_CONFIG;
    }

    if (!service->bind())
        return EXIT_BIND;

    std::atomic<bool> shuttingDown{false};
    std::thread signalThread([&] {
        int signal = 0;
        sigwait(&signals, &signal);
        if (!shuttingDown)
            log().info("Received signal {}, shutting down.", signal);
        shuttingDown = true;
        service->stop();
    });

    service->run();

    // Release the signal thread if the server stopped on its own.
    if (!shuttingDown.exchange(true))
        pthread_kill(signalThread.native_handle(), SIGTERM);
    signalThread.join();

    service.reset();
    return EXIT_ORDERLY;
}
