#ifndef FILESHARE_HTTP_MESSAGE_H
#define FILESHARE_HTTP_MESSAGE_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace fileshare {

// HTTP request head. Header names are stored lower-case.
struct HttpRequest {
    std::string method;           // GET, POST, ...
    std::string path;
    std::string query_string;
    std::string version;          // HTTP/1.1
    std::unordered_map<std::string, std::string> headers;

    std::string get_header(const std::string& name) const;
    bool has_header(const std::string& name) const;

    // nullopt when absent or not a plain decimal number
    std::optional<uint64_t> content_length() const;
    bool is_chunked() const;
};

// HTTP response. The body is only used by whole-body responses; streamed
// responses send the head and then write the body themselves.
struct HttpResponse {
    uint16_t status_code = 200;
    std::string status_message = "OK";
    std::unordered_map<std::string, std::string> headers;
    std::string body;

    HttpResponse() = default;
    HttpResponse(uint16_t code, std::string content_type, std::string body_text);

    void set_header(const std::string& name, const std::string& value);
    std::string get_header(const std::string& name) const;

    // Status line, headers and the blank line
    std::string serialize_head() const;
};

const char* status_reason(uint16_t status_code);

// Parses "METHOD target HTTP/x.y\r\nName: value\r\n..." without the final
// blank line. nullopt for anything malformed.
std::optional<HttpRequest> parse_request_head(std::string_view head);

// Wire form with Content-Length and "Connection: close" filled in
std::string serialize_response(HttpResponse response);
// Head only, "Connection: close", for bodies written afterwards
std::string serialize_streamed_head(HttpResponse response);

// RFC 7230 quoted-string. Quotes and backslashes are escaped, control
// characters are dropped.
std::string quote_header_value(std::string_view value);

// application/json responses
HttpResponse json_response(uint16_t status_code, const std::string& json_body);
// {"error": message}
HttpResponse error_response(uint16_t status_code, const std::string& message);

} // namespace fileshare

#endif // FILESHARE_HTTP_MESSAGE_H
