#ifndef FILESHARE_HTTP_RANGE_H
#define FILESHARE_HTTP_RANGE_H

#include <cstdint>
#include <string>

namespace fileshare {

// Inclusive byte interval
struct ByteRange {
    uint64_t first = 0;
    uint64_t last = 0;

    uint64_t length() const { return last - first + 1; }
};

enum class RangeKind {
    None,           // absent, malformed or multi-range: serve the whole file
    Satisfiable,
    Unsatisfiable
};

struct RangeRequest {
    RangeKind kind = RangeKind::None;
    ByteRange range;
};

// Single "bytes=first-last", "bytes=first-" or "bytes=-suffix" against a
// resource of the given size
RangeRequest parse_range_header(const std::string& header, uint64_t size);

// "bytes first-last/size"
std::string content_range(const ByteRange& range, uint64_t size);
// "bytes */size"
std::string unsatisfied_range(uint64_t size);

} // namespace fileshare

#endif // FILESHARE_HTTP_RANGE_H
