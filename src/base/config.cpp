#include "fileshare/base/config.h"
#include "fileshare/base/logger.h"
#include "fileshare/base/error_code.h"
#include "CLI/CLI.hpp"
#include <fstream>
#include <iostream>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <algorithm>
#include <cctype>

namespace fileshare {

namespace {

std::string trim(const std::string& str) {
    auto start = std::find_if(str.begin(), str.end(), [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(str.rbegin(), str.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : "";
}

bool parse_bool(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

// Simple INI-style parser for config files
void parse_ini_file(const std::string& path, std::map<std::string, std::map<std::string, std::string>>& sections) {
    std::ifstream file(path);
    if (!file.is_open()) return;

    std::string current_section;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            sections[current_section] = {};
            continue;
        }

        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            // Remove quotes
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
                value = value.substr(1, value.size() - 2);
            }
            sections[current_section][key] = value;
        }
    }
}

// Locate -c/--config before the full parse so the file sits below env and flags
std::string find_config_argument(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind("--config=", 0) == 0) {
            return arg.substr(std::strlen("--config="));
        }
    }
    return "";
}

} // anonymous namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& path) {
    Logger::instance().info("Loading config from file: " + path);

    if (!std::filesystem::exists(path)) {
        Logger::instance().warning("Config file not found: " + path);
        return false;
    }

    config_file_ = path;

    std::map<std::string, std::map<std::string, std::string>> sections;
    parse_ini_file(path, sections);

    try {
        apply_sections(sections);
    } catch (const std::exception& e) {
        Logger::instance().error("Invalid value in config file " + path + ": " + e.what());
        return false;
    }

    Logger::instance().info("Config loaded successfully from: " + path);
    return true;
}

void Config::apply_sections(std::map<std::string, std::map<std::string, std::string>>& sections) {
    if (sections.count("log")) {
        auto& s = sections["log"];
        if (s.count("level")) config_.log.level = s["level"];
        if (s.count("output")) config_.log.output = s["output"];
        if (s.count("file_path")) config_.log.file_path = s["file_path"];
    }

    if (sections.count("server")) {
        auto& s = sections["server"];
        if (s.count("bind_address")) config_.server.bind_address = s["bind_address"];
        if (s.count("port")) config_.server.port = static_cast<uint16_t>(std::stoi(s["port"]));
        if (s.count("worker_threads")) config_.server.worker_threads = std::stoul(s["worker_threads"]);
        if (s.count("auto_exit")) config_.server.auto_exit = parse_bool(s["auto_exit"]);
        if (s.count("auto_exit_delay_ms")) config_.server.auto_exit_delay_ms = std::stoul(s["auto_exit_delay_ms"]);
    }

    if (sections.count("transfer")) {
        auto& s = sections["transfer"];
        if (s.count("chunk_size_kb")) config_.transfer.chunk_size = std::stoul(s["chunk_size_kb"]) * 1024;
        if (s.count("log_capacity")) config_.transfer.log_capacity = std::stoul(s["log_capacity"]);
        if (s.count("subscriber_buffer")) config_.transfer.subscriber_buffer = std::stoul(s["subscriber_buffer"]);
        if (s.count("heartbeat_interval_ms")) config_.transfer.heartbeat_interval_ms = std::stoul(s["heartbeat_interval_ms"]);
        if (s.count("archive_compression")) config_.transfer.archive_compression = s["archive_compression"];
        if (s.count("deflate_level")) config_.transfer.deflate_level = std::stoi(s["deflate_level"]);
    }
}

bool Config::load_from_env() {
    if (const char* val = std::getenv("FILESHARE_PORT")) {
        config_.server.port = static_cast<uint16_t>(std::stoi(val));
    }
    if (const char* val = std::getenv("FILESHARE_BIND_ADDRESS")) {
        config_.server.bind_address = val;
    }
    if (const char* val = std::getenv("FILESHARE_AUTO_EXIT")) {
        config_.server.auto_exit = parse_bool(val);
    }
    if (const char* val = std::getenv("FILESHARE_LOG_LEVEL")) {
        config_.log.level = val;
    }
    if (const char* val = std::getenv("FILESHARE_CHUNK_SIZE_KB")) {
        config_.transfer.chunk_size = std::stoul(val) * 1024;
    }
    return true;
}

bool Config::parse_command_line(int argc, char* argv[]) {
    exit_code_ = 0;

    std::string config_file = find_config_argument(argc, argv);
    if (!config_file.empty() && !load_from_file(config_file)) {
        std::cerr << "Error: cannot load config file '" << config_file << "'" << std::endl;
        exit_code_ = 1;
        return false;
    }

    try {
        load_from_env();
    } catch (const std::exception& e) {
        std::cerr << "Invalid FILESHARE_* environment value: " << e.what() << std::endl;
        exit_code_ = 1;
        return false;
    }

    CLI::App app{"FileShare - share a file or receive uploads over HTTP"};

    app.add_option("-c,--config", config_file, "Path to configuration file");

    app.add_option("mode", config_.session.mode, "send: share a file or directory, recv: receive uploads")
        ->required()
        ->check(CLI::IsMember({"send", "recv"}));
    app.add_option("path", config_.session.path, "File or directory to send, or directory to receive into")
        ->required();

    // Server options
    app.add_option("-p,--port", config_.server.port, "Port to listen on (0 for random)");
    app.add_option("--bind-address", config_.server.bind_address, "Bind address");
    app.add_flag("--auto-exit", config_.server.auto_exit, "Auto exit after transfer complete");
    app.add_option("--workers", config_.server.worker_threads, "Scheduler worker threads")
        ->check(CLI::Range(1u, 64u));

    // Transfer options
    size_t chunk_size_kb = config_.transfer.chunk_size / 1024;
    app.add_option("--chunk-size-kb", chunk_size_kb, "Streaming chunk size (KiB)")
        ->check(CLI::Range(static_cast<size_t>(1), static_cast<size_t>(16 * 1024)));
    app.add_option("--compression", config_.transfer.archive_compression, "Directory archive method (store, deflate)")
        ->check(CLI::IsMember({"store", "deflate"}));

    // Log options
    app.add_option("--log-level", config_.log.level, "Log level (debug, info, warning, error)");
    app.add_option("--log-output", config_.log.output, "Log output (console, file)")
        ->check(CLI::IsMember({"console", "file"}));
    app.add_option("--log-file", config_.log.file_path, "Log file path");

    app.set_version_flag("-v,--version", "0.1.0");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Prints help/version text, or the parse error with usage
        exit_code_ = app.exit(e);
        return false;
    }

    config_.transfer.chunk_size = chunk_size_kb * 1024;
    return true;
}

void Config::validate() {
    auto& session = config_.session;
    if (session.mode != "send" && session.mode != "recv") {
        throw FileShareError(ErrorCode::InvalidMode, "mode must be 'send' or 'recv', got '" + session.mode + "'");
    }

    std::error_code ec;
    if (session.mode == "send") {
        if (!std::filesystem::exists(session.path, ec)) {
            std::string reason = ec ? ec.message() : "no such file or directory";
            throw FileShareError(ErrorCode::NotFound, "cannot access '" + session.path + "': " + reason);
        }
        return;
    }

    std::filesystem::create_directories(session.path, ec);
    if (ec) {
        throw FileShareError(ErrorCode::InvalidArgument,
                             "cannot create directory '" + session.path + "': " + ec.message());
    }
    if (!std::filesystem::is_directory(session.path, ec)) {
        throw FileShareError(ErrorCode::InvalidArgument, "'" + session.path + "' is not a directory");
    }
}

void Config::apply_logging() const {
    Logger::instance().set_level(parse_log_level(config_.log.level));
    if (config_.log.output == "file" && !config_.log.file_path.empty()) {
        if (!Logger::instance().set_file_output(config_.log.file_path)) {
            Logger::instance().warning("Cannot open log file {}, logging to console", config_.log.file_path);
        }
    }
}

void Config::print() const {
    Logger::instance().debug("=== Configuration ===");
    Logger::instance().debug("Mode: {}", config_.session.mode);
    Logger::instance().debug("Path: {}", config_.session.path);
    Logger::instance().debug("Listen: {}:{}", config_.server.bind_address, config_.server.port);
    Logger::instance().debug("Auto exit: {}", config_.server.auto_exit);
    Logger::instance().debug("Chunk size: {} bytes", config_.transfer.chunk_size);
    Logger::instance().debug("Archive compression: {}", config_.transfer.archive_compression);
    Logger::instance().debug("Log level: {}", config_.log.level);
}

} // namespace fileshare
