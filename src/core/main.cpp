#include "rcb/core/application.hpp"
#include "rcb/version.hpp"

#include <asio/io_context.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/signal_set.hpp>
#include <csignal>
#include <filesystem>
#include <iostream>

int main(int argc, char* argv[]) {
    std::cout << "Radio Control Bridge (C++20)" << std::endl;
    std::cout << "Version: " << rcb::kVersion << std::endl;
    std::cout << "Git: " << rcb::kGitVersion << std::endl;
    std::cout << "Built: " << rcb::kBuildTimestamp << std::endl;
    std::cout << std::endl;

    try {
        std::filesystem::path configPath = "config/default.yaml";
        if (argc > 1) {
            configPath = argv[1];
        }

        asio::io_context io_context{1};
        auto work = asio::make_work_guard(io_context);

        rcb::core::Application app{io_context, configPath};

        asio::signal_set signals{io_context, SIGINT, SIGTERM};
        signals.async_wait([&](const std::error_code& ec, int signal) {
            if (ec) {
                return;
            }
            std::cout << "\nReceived signal " << signal << ", shutting down..." << std::endl;
            work.reset();
            app.stop();
        });

        app.start();
        io_context.run();
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
