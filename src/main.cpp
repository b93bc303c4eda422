#include "OrderCoreApp.hpp"
#include <iostream>
#include <csignal>

// Global pointer for signal handler
ordercore::OrderCoreApp* g_app = nullptr;

void signalHandler(int signal) {
    if (g_app) {
        g_app->stop();
    }
    (void)signal;
}

int main() {
    try {
        ordercore::OrderCoreApp app;
        g_app = &app;

        // Signal handlers для graceful shutdown в Kubernetes
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::cout << "========================================" << std::endl;
        std::cout << "  Order Core Service v1.0.0 Starting" << std::endl;
        std::cout << "  Press Ctrl+C to stop" << std::endl;
        std::cout << "========================================" << std::endl;

        int code = app.run();

        g_app = nullptr;
        std::cout << "[main] Order Core Service stopped" << std::endl;
        return code;

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
