#include "fileshare/util/fs_utils.h"
#include <fmt/format.h>
#include <chrono>
#include <ctime>

namespace fileshare {

uint64_t calculate_dir_size(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(path, ec)) {
        auto size = std::filesystem::file_size(path, ec);
        return ec ? 0 : size;
    }

    uint64_t total = 0;
    std::filesystem::recursive_directory_iterator it(
        path, std::filesystem::directory_options::skip_permission_denied, ec);
    std::filesystem::recursive_directory_iterator end;

    while (!ec && it != end) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec)) {
            auto size = it->file_size(entry_ec);
            if (!entry_ec) {
                total += size;
            }
        }
        it.increment(ec);
    }
    return total;
}

std::string format_size(uint64_t size) {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = 1024 * KB;
    constexpr uint64_t GB = 1024 * MB;

    if (size >= GB) {
        return fmt::format("{:.2f} GB", static_cast<double>(size) / GB);
    }
    if (size >= MB) {
        return fmt::format("{:.2f} MB", static_cast<double>(size) / MB);
    }
    if (size >= KB) {
        return fmt::format("{:.2f} KB", static_cast<double>(size) / KB);
    }
    return fmt::format("{} B", size);
}

std::string display_name(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path normal = std::filesystem::absolute(path, ec);
    if (ec) {
        normal = path;
    }
    normal = normal.lexically_normal();

    std::string name = normal.filename().string();
    if (name.empty() && normal.has_relative_path()) {
        name = normal.parent_path().filename().string();
    }
    return name.empty() ? normal.string() : name;
}

std::time_t file_time_to_time_t(std::filesystem::file_time_type time) {
    auto sys_time = std::chrono::file_clock::to_sys(time);
    return std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::system_clock::duration>(sys_time));
}

std::string http_date(std::filesystem::file_time_type time) {
    auto tt = file_time_to_time_t(time);

    std::tm tm_buf{};
    gmtime_r(&tt, &tm_buf);

    char buffer[64];
    std::strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S GMT", &tm_buf);
    return buffer;
}

} // namespace fileshare
