#ifndef FILESHARE_UTIL_FS_UTILS_H
#define FILESHARE_UTIL_FS_UTILS_H

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>

namespace fileshare {

// Sum of regular file sizes below path; unreadable entries are skipped.
// A regular file yields its own size.
uint64_t calculate_dir_size(const std::filesystem::path& path);

// "512 B", "1.50 KB", "2.00 MB", "1.25 GB"
std::string format_size(uint64_t size);

// Last path component, ignoring trailing separators ("a/b/" -> "b")
std::string display_name(const std::filesystem::path& path);

std::time_t file_time_to_time_t(std::filesystem::file_time_type time);

// "Thu, 01 Jan 1970 00:00:00 GMT"
std::string http_date(std::filesystem::file_time_type time);

} // namespace fileshare

#endif // FILESHARE_UTIL_FS_UTILS_H
