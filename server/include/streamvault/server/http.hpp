#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace streamvault::server::http
{

    using HeaderList = std::vector<std::pair<std::string, std::string>>;

    struct HttpRequest
    {
        std::string method;
        std::string target;
        std::string path;
        std::string query;
        std::string version;
        std::map<std::string, std::string> headers; // keys lower-cased
        std::string body;

        std::optional<std::string_view> header(std::string_view name) const;

        bool keep_alive() const;
    };

    struct HttpResponse
    {
        int status{200};
        HeaderList headers;
        std::string body;

        static HttpResponse json(int status, const nlohmann::json &payload);
        static HttpResponse empty(int status);
    };

    std::string_view reason_phrase(int status) noexcept;

    // Status line plus headers, including Content-Length and Connection.
    std::string format_response_head(int status, const HeaderList &headers, std::uint64_t content_length,
                                     bool keep_alive);

    std::string serialize(const HttpResponse &response, bool keep_alive, bool include_body = true);

    // Decodes %XX escapes; malformed escapes are kept literally.
    std::string url_decode(std::string_view text);

    // "/api/video-detail/a%20b.mp4" -> {"api", "video-detail", "a b.mp4"}
    std::vector<std::string> split_path(std::string_view path);

    std::string to_lower(std::string_view text);

    enum class ParseState
    {
        RequestLine,
        Headers,
        Body,
        Complete,
        Error
    };

    // Incremental HTTP/1.1 request parser over a growing byte buffer. Bodies
    // must be delimited by Content-Length.
    class HttpRequestParser
    {
    public:
        explicit HttpRequestParser(std::size_t max_body_bytes);

        ParseState feed(std::string_view data);

        ParseState state() const noexcept { return state_; }

        // Headers are in, the body is still outstanding and the client asked
        // for an interim 100 response.
        bool expects_continue() const;

        int error_status() const noexcept { return error_status_; }
        const std::string &error_message() const noexcept { return error_message_; }

        // Hands out the completed request and starts on any pipelined bytes
        // that followed it.
        HttpRequest take_request();

    private:
        void advance();
        bool parse_request_line();
        bool parse_header_line();
        bool parse_body();
        void finish_headers();
        void fail(int status, std::string message);

        std::size_t max_body_bytes_;
        std::string buffer_;
        std::size_t position_{0};
        std::size_t header_bytes_{0};
        std::uint64_t content_length_{0};
        ParseState state_{ParseState::RequestLine};
        HttpRequest current_;
        int error_status_{0};
        std::string error_message_;
    };

} // namespace streamvault::server::http
