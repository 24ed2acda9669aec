#include "app/ProxyApplication.hpp"
#include "app/StopSignals.hpp"
#include "utils/Config.hpp"

#include <signal.h>

#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
    signal(SIGPIPE, SIG_IGN);

    // before any thread starts so only the waiter sees SIGINT/SIGTERM
    StopSignals signals;

    Config cfg = Config::fromCommandLine(argc, argv, "config/proxy.json");

    try {
        ProxyApplication app(cfg);
        if (!app.start()) {
            std::cerr << "[MAIN] Cannot start on port " << cfg.port << "\n";
            return 1;
        }

        signals.watch([&app](int) { app.shutdown(); });

        try {
            app.await();
        } catch (...) {
            // the waiter must not outlive app
            signals.release();
            throw;
        }
        signals.release();

        if (signals.received() == 0) {
            std::cerr << "[MAIN] Server loop ended without a stop signal\n";
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "[MAIN] Fatal: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

//cmake -S . -B build
//cmake --build build
//./build/artifact_proxy --port=5956 --log.level=debug
