#include "fileshare/http/range.h"
#include <optional>
#include <string_view>

namespace fileshare {

namespace {

std::optional<uint64_t> parse_number(std::string_view s) {
    if (s.empty() || s.size() > 19) {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    return value;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

} // anonymous namespace

RangeRequest parse_range_header(const std::string& header, uint64_t size) {
    RangeRequest result;

    std::string_view ranges = trim(header);
    constexpr std::string_view prefix = "bytes=";
    if (ranges.substr(0, prefix.size()) != prefix) {
        return result;
    }
    ranges = trim(ranges.substr(prefix.size()));

    if (ranges.find(',') != std::string_view::npos) {
        return result;
    }

    size_t dash = ranges.find('-');
    if (dash == std::string_view::npos) {
        return result;
    }

    std::string_view first_text = trim(ranges.substr(0, dash));
    std::string_view last_text = trim(ranges.substr(dash + 1));

    if (first_text.empty()) {
        // bytes=-N: the final N bytes
        auto suffix = parse_number(last_text);
        if (!suffix) {
            return result;
        }
        if (*suffix == 0 || size == 0) {
            result.kind = RangeKind::Unsatisfiable;
            return result;
        }
        uint64_t length = *suffix < size ? *suffix : size;
        result.kind = RangeKind::Satisfiable;
        result.range = {size - length, size - 1};
        return result;
    }

    auto first = parse_number(first_text);
    if (!first) {
        return result;
    }

    uint64_t last = size > 0 ? size - 1 : 0;
    if (!last_text.empty()) {
        auto parsed = parse_number(last_text);
        if (!parsed || *parsed < *first) {
            return result;
        }
        if (*parsed < last) {
            last = *parsed;
        }
    }

    if (*first >= size) {
        result.kind = RangeKind::Unsatisfiable;
        return result;
    }

    result.kind = RangeKind::Satisfiable;
    result.range = {*first, last};
    return result;
}

std::string content_range(const ByteRange& range, uint64_t size) {
    return "bytes " + std::to_string(range.first) + "-" + std::to_string(range.last) +
           "/" + std::to_string(size);
}

std::string unsatisfied_range(uint64_t size) {
    return "bytes */" + std::to_string(size);
}

} // namespace fileshare
