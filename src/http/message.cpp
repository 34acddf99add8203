#include "fileshare/http/message.h"
#include <nlohmann/json.hpp>
#include <cctype>

using json = nlohmann::json;

namespace fileshare {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

bool is_token(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        auto uc = static_cast<unsigned char>(c);
        if (uc <= 32 || uc >= 127 || c == ':' || c == '"' || c == '(' || c == ')' ||
            c == ',' || c == '/' || c == ';' || c == '<' || c == '>' || c == '=' ||
            c == '?' || c == '@' || c == '[' || c == ']' || c == '\\' || c == '{' || c == '}') {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

std::string HttpRequest::get_header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    if (it != headers.end()) {
        return it->second;
    }
    return {};
}

bool HttpRequest::has_header(const std::string& name) const {
    return headers.find(to_lower(name)) != headers.end();
}

std::optional<uint64_t> HttpRequest::content_length() const {
    auto it = headers.find("content-length");
    if (it == headers.end() || it->second.empty() || it->second.size() > 19) {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (char c : it->second) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    return value;
}

bool HttpRequest::is_chunked() const {
    return to_lower(get_header("transfer-encoding")).find("chunked") != std::string::npos;
}

HttpResponse::HttpResponse(uint16_t code, std::string content_type, std::string body_text)
    : status_code(code), status_message(status_reason(code)), body(std::move(body_text)) {
    headers["Content-Type"] = std::move(content_type);
}

void HttpResponse::set_header(const std::string& name, const std::string& value) {
    headers[name] = value;
}

std::string HttpResponse::get_header(const std::string& name) const {
    auto it = headers.find(name);
    if (it != headers.end()) {
        return it->second;
    }
    return {};
}

std::string HttpResponse::serialize_head() const {
    std::string head = "HTTP/1.1 " + std::to_string(status_code) + " " + status_message + "\r\n";
    for (const auto& [name, value] : headers) {
        head += name;
        head += ": ";
        head += value;
        head += "\r\n";
    }
    head += "\r\n";
    return head;
}

const char* status_reason(uint16_t status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 206: return "Partial Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 411: return "Length Required";
        case 416: return "Range Not Satisfiable";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

std::optional<HttpRequest> parse_request_head(std::string_view head) {
    HttpRequest request;

    size_t line_end = head.find("\r\n");
    std::string_view request_line = head.substr(0, line_end);

    // METHOD SP request-target SP HTTP-version
    size_t sp1 = request_line.find(' ');
    if (sp1 == std::string_view::npos) return std::nullopt;
    size_t sp2 = request_line.find(' ', sp1 + 1);
    if (sp2 == std::string_view::npos) return std::nullopt;
    if (request_line.find(' ', sp2 + 1) != std::string_view::npos) return std::nullopt;

    std::string_view method = request_line.substr(0, sp1);
    std::string_view target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
    std::string_view version = request_line.substr(sp2 + 1);

    if (!is_token(method)) return std::nullopt;
    if (target.empty() || target.front() != '/') return std::nullopt;
    if (version.substr(0, 7) != "HTTP/1.") return std::nullopt;

    request.method = std::string(method);
    request.version = std::string(version);

    size_t query_pos = target.find('?');
    request.path = std::string(target.substr(0, query_pos));
    if (query_pos != std::string_view::npos) {
        request.query_string = std::string(target.substr(query_pos + 1));
    }

    size_t pos = line_end == std::string_view::npos ? head.size() : line_end + 2;
    while (pos < head.size()) {
        size_t end = head.find("\r\n", pos);
        std::string_view line = head.substr(pos, end == std::string_view::npos ? std::string_view::npos : end - pos);
        pos = end == std::string_view::npos ? head.size() : end + 2;

        if (line.empty()) continue;
        // Obsolete line folding is not accepted
        if (line.front() == ' ' || line.front() == '\t') return std::nullopt;

        size_t colon = line.find(':');
        if (colon == std::string_view::npos) return std::nullopt;

        std::string_view name = line.substr(0, colon);
        if (!is_token(name)) return std::nullopt;

        std::string key = to_lower(name);
        std::string value(trim(line.substr(colon + 1)));

        auto it = request.headers.find(key);
        if (it == request.headers.end()) {
            request.headers.emplace(std::move(key), std::move(value));
        } else if (key == "content-length") {
            if (it->second != value) return std::nullopt;
        } else {
            it->second += ", " + value;
        }
    }

    return request;
}

std::string serialize_response(HttpResponse response) {
    response.set_header("Content-Length", std::to_string(response.body.size()));
    response.set_header("Connection", "close");
    return response.serialize_head() + response.body;
}

std::string serialize_streamed_head(HttpResponse response) {
    response.set_header("Connection", "close");
    return response.serialize_head();
}

std::string quote_header_value(std::string_view value) {
    std::string quoted = "\"";
    for (char c : value) {
        auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f) continue;
        if (c == '"' || c == '\\') {
            quoted += '\\';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

HttpResponse json_response(uint16_t status_code, const std::string& json_body) {
    return HttpResponse(status_code, "application/json", json_body);
}

HttpResponse error_response(uint16_t status_code, const std::string& message) {
    json j = {{"error", message}};
    return json_response(status_code, j.dump());
}

} // namespace fileshare
