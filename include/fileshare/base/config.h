#ifndef FILESHARE_BASE_CONFIG_H
#define FILESHARE_BASE_CONFIG_H

#include <string>
#include <cstdint>
#include <map>

namespace fileshare {

// Log configuration
struct LogConfig {
    std::string level = "info";
    std::string output = "console";  // console, file
    std::string file_path = "";
};

// HTTP listener configuration
struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 0;  // 0 means random port
    uint32_t worker_threads = 2;
    bool auto_exit = false;
    uint32_t auto_exit_delay_ms = 500;
    size_t max_header_bytes = 64 * 1024;
};

// Streaming and observer tuning
struct TransferConfig {
    size_t chunk_size = 64 * 1024;
    size_t log_capacity = 100;
    size_t subscriber_buffer = 10;
    uint32_t heartbeat_interval_ms = 500;
    uint32_t event_poll_interval_ms = 50;
    std::string archive_compression = "store";  // store, deflate
    int deflate_level = 6;
};

// What this process shares
struct SessionConfig {
    std::string mode;  // send, recv
    std::string path;
};

// Global configuration
struct GlobalConfig {
    LogConfig log;
    ServerConfig server;
    TransferConfig transfer;
    SessionConfig session;
};

class Config {
public:
    static Config& instance();

    // Load configuration from an INI-style file
    bool load_from_file(const std::string& path);

    // Load configuration from environment variables
    bool load_from_env();

    // Parse command line arguments and override config.
    // Returns false for --help/--version or parse errors; exit_code() tells which.
    bool parse_command_line(int argc, char* argv[]);
    int exit_code() const { return exit_code_; }

    // Get configuration
    const GlobalConfig& get() const { return config_; }
    GlobalConfig& get() { return config_; }

    // Get config file path that was loaded
    const std::string& get_config_file() const { return config_file_; }

    // Check mode and target path; creates the receive directory.
    // Throws FileShareError on failure.
    void validate();

    // Apply the log section to the Logger
    void apply_logging() const;

    // Print configuration (for debugging)
    void print() const;

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void apply_sections(std::map<std::string, std::map<std::string, std::string>>& sections);

    GlobalConfig config_;
    std::string config_file_;
    int exit_code_ = 0;
};

} // namespace fileshare

#endif // FILESHARE_BASE_CONFIG_H
