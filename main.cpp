#include <iostream>
#include <memory>
#include <string>
#include <csignal>
#include <thread>
#include <chrono>
#include <filesystem>
#include <system_error>

#include "fileshare/base/logger.h"
#include "fileshare/base/config.h"
#include "fileshare/base/error_code.h"
#include "fileshare/server/file_server.h"
#include "fileshare/session/transfer_session.h"
#include "fileshare/util/fs_utils.h"
#include "fileshare/util/net_utils.h"

using namespace fileshare;

// Global flag for signal handling
static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = 0;
    }
}

class FileShareApplication {
public:
    FileShareApplication() = default;
    ~FileShareApplication() {
        if (server_) {
            server_->stop();
        }
    }

    // Returns false with exit_code() set when the process should end early
    bool initialize(int argc, char* argv[]) {
        if (!Config::instance().parse_command_line(argc, argv)) {
            exit_code_ = Config::instance().exit_code();
            return false;
        }

        Config::instance().apply_logging();

        try {
            Config::instance().validate();
        } catch (const FileShareError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            exit_code_ = 1;
            return false;
        }

        Config::instance().print();

        const auto& config = Config::instance().get();
        auto mode = parse_transfer_mode(config.session.mode);
        if (!mode) {
            std::cerr << "Error: mode must be 'send' or 'recv'" << std::endl;
            exit_code_ = 1;
            return false;
        }

        session_ = std::make_shared<TransferSession>(*mode, config.session.path, config.transfer);
        server_ = std::make_unique<FileServer>(config.server, session_);
        return true;
    }

    bool start() {
        if (!server_->start()) {
            const auto& server = Config::instance().get().server;
            std::cerr << "Error: cannot listen on " << server.bind_address << ":"
                      << server.port << std::endl;
            exit_code_ = 1;
            return false;
        }
        print_banner();
        return true;
    }

    void stop() {
        Logger::instance().info("Stopping FileShare...");
        if (server_) {
            server_->stop();
        }
        Logger::instance().info("FileShare stopped");
    }

    void run() {
        const auto& server = Config::instance().get().server;

        while (g_running) {
            if (server.auto_exit && server_->transfer_finished()) {
                Logger::instance().info("Transfer finished, exiting");
                // Let the last response and status events reach the peers
                std::this_thread::sleep_for(std::chrono::milliseconds(server.auto_exit_delay_ms));
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        stop();
    }

    int exit_code() const { return exit_code_; }

private:
    void print_banner() const {
        const auto& config = Config::instance().get();
        const auto& target = session_->target_path();
        uint16_t port = server_->get_listen_port();

        std::cout << "FileShare - Ready" << std::endl;
        std::cout << std::endl;
        std::cout << "Mode: " << (session_->mode() == TransferMode::Send ? "SEND" : "RECV") << std::endl;

        std::error_code ec;
        std::string name = display_name(target);
        if (std::filesystem::is_directory(target, ec)) {
            std::cout << "Target: " << name << " (directory, "
                      << format_size(calculate_dir_size(target)) << ")" << std::endl;
        } else {
            auto size = std::filesystem::file_size(target, ec);
            std::cout << "Target: " << name << " (" << format_size(ec ? 0 : size) << ")" << std::endl;
        }

        std::cout << std::endl;
        std::cout << "URLs:" << std::endl;
        if (config.server.bind_address == "0.0.0.0") {
            for (const auto& ip : get_local_ips()) {
                std::cout << "  http://" << ip << ":" << port << std::endl;
            }
        } else {
            std::cout << "  http://" << config.server.bind_address << ":" << port << std::endl;
        }

        std::cout << std::endl;
        if (config.server.auto_exit) {
            std::cout << "Will exit after the transfer finishes" << std::endl;
        }
        std::cout << "Press Ctrl+C to stop" << std::endl;
    }

    std::shared_ptr<TransferSession> session_;
    std::unique_ptr<FileServer> server_;
    int exit_code_ = 0;
};

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    // Peers that hang up mid-stream surface as write errors
    std::signal(SIGPIPE, SIG_IGN);

    try {
        FileShareApplication app;

        if (!app.initialize(argc, argv)) {
            return app.exit_code();
        }

        if (!app.start()) {
            return app.exit_code();
        }

        app.run();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
