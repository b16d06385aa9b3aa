#include "RegistryApp.hpp"
#include <csignal>
#include <iostream>

namespace {

registry::RegistryApp* runningApp = nullptr;

void onShutdownSignal(int signal) {
    std::cout << "\n[main] Signal " << signal << ": stopping registry" << std::endl;
    if (runningApp) {
        runningApp->stop();
    }
}

void printBanner() {
    std::cout << "========================================" << std::endl;
    std::cout << "  Session Registry v1.0.0" << std::endl;
    std::cout << "  Sessions:   /api/v1/sessions" << std::endl;
    std::cout << "  Attendance: /api/v1/attendance" << std::endl;
    std::cout << "  Ops:        /health, /metrics" << std::endl;
    std::cout << "========================================" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    printBanner();

    try {
        registry::RegistryApp app;
        runningApp = &app;

        std::signal(SIGINT, onShutdownSignal);
        std::signal(SIGTERM, onShutdownSignal);

        // loadEnvironment() -> configureInjection() -> start(), блокирует до stop()
        app.run(argc, argv);

        runningApp = nullptr;
        std::cout << "[main] Session Registry stopped" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        runningApp = nullptr;
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
