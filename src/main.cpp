#include "habitual.hpp"

#include <csignal>
#include <iostream>
#include <pthread.h>

int main(int argc, char **argv) {
    Config config;
    try {
        config = ParseConfig(argc, argv);
    } catch (const std::invalid_argument &e) {
        std::cerr << "Error: " << e.what() << "\n" << Usage(argv[0]);
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (config.help) {
        std::cout << Usage(argv[0]);
        return 0;
    }

    ApplyLogLevel(config.logLevel);
    spdlog::info("Habitual {}", HABITUAL_VERSION);
    spdlog::info("DataBase path: {}", config.dbPath.string());

    // Signals are handled by sigwait below; block them before any thread starts.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    try {
        HabitStore store(config.dbPath);

        if (config.migrate) {
            store.Migrate();
            return 0;
        }
        store.VerifySchema();

        Habitual app(config, store);
        if (!app.Start()) {
            return 1;
        }

        int sig = 0;
        sigwait(&signals, &sig);
        spdlog::info("Received signal {}, shutting down", sig);
        app.Stop();
        app.Wait();
    } catch (const StoreError &e) {
        spdlog::critical("Database error: {}", e.what());
        return 1;
    } catch (const std::exception &e) {
        spdlog::critical("Startup failed: {}", e.what());
        return 1;
    }

    spdlog::info("Bye");
    return 0;
}
