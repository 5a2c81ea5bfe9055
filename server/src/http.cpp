#include "streamvault/server/http.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <stdexcept>
#include <system_error>

namespace streamvault::server::http
{

    namespace
    {

        constexpr std::size_t kMaxHeaderBytes = 16 * 1024;

        struct StatusReason
        {
            int status;
            std::string_view reason;
        };

        constexpr std::array<StatusReason, 17> kReasons{{
            {100, "Continue"},
            {200, "OK"},
            {201, "Created"},
            {202, "Accepted"},
            {204, "No Content"},
            {206, "Partial Content"},
            {400, "Bad Request"},
            {404, "Not Found"},
            {405, "Method Not Allowed"},
            {413, "Payload Too Large"},
            {416, "Range Not Satisfiable"},
            {431, "Request Header Fields Too Large"},
            {500, "Internal Server Error"},
            {501, "Not Implemented"},
            {502, "Bad Gateway"},
            {503, "Service Unavailable"},
            {505, "HTTP Version Not Supported"},
        }};

        std::string_view trim(std::string_view value)
        {
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t'))
            {
                value.remove_suffix(1);
            }
            return value;
        }

        int hex_value(char c)
        {
            if (c >= '0' && c <= '9')
            {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f')
            {
                return c - 'a' + 10;
            }
            if (c >= 'A' && c <= 'F')
            {
                return c - 'A' + 10;
            }
            return -1;
        }

        bool is_token(std::string_view text)
        {
            return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c)
                                                { return std::isalnum(c) || c == '-' || c == '_' || c == '.'; });
        }

    } // namespace

    std::string to_lower(std::string_view text)
    {
        std::string lowered(text);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return lowered;
    }

    std::optional<std::string_view> HttpRequest::header(std::string_view name) const
    {
        const auto it = headers.find(to_lower(name));
        if (it == headers.end())
        {
            return std::nullopt;
        }
        return std::string_view(it->second);
    }

    bool HttpRequest::keep_alive() const
    {
        const auto connection = to_lower(header("connection").value_or(""));
        if (version == "HTTP/1.0")
        {
            return connection.find("keep-alive") != std::string::npos;
        }
        return connection.find("close") == std::string::npos;
    }

    HttpResponse HttpResponse::json(int status, const nlohmann::json &payload)
    {
        HttpResponse response;
        response.status = status;
        response.headers.emplace_back("Content-Type", "application/json");
        response.body = payload.dump();
        return response;
    }

    HttpResponse HttpResponse::empty(int status)
    {
        HttpResponse response;
        response.status = status;
        return response;
    }

    std::string_view reason_phrase(int status) noexcept
    {
        for (const auto &entry : kReasons)
        {
            if (entry.status == status)
            {
                return entry.reason;
            }
        }
        return "Unknown";
    }

    std::string format_response_head(int status, const HeaderList &headers, std::uint64_t content_length,
                                     bool keep_alive)
    {
        std::string head = "HTTP/1.1 " + std::to_string(status) + " " + std::string(reason_phrase(status)) + "\r\n";
        for (const auto &[name, value] : headers)
        {
            head += name;
            head += ": ";
            head += value;
            head += "\r\n";
        }
        head += "Content-Length: " + std::to_string(content_length) + "\r\n";
        head += keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
        head += "\r\n";
        return head;
    }

    std::string serialize(const HttpResponse &response, bool keep_alive, bool include_body)
    {
        auto message = format_response_head(response.status, response.headers, response.body.size(), keep_alive);
        if (include_body)
        {
            message += response.body;
        }
        return message;
    }

    std::string url_decode(std::string_view text)
    {
        std::string decoded;
        decoded.reserve(text.size());
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            if (text[i] == '%' && i + 2 < text.size())
            {
                const int high = hex_value(text[i + 1]);
                const int low = hex_value(text[i + 2]);
                if (high >= 0 && low >= 0)
                {
                    decoded.push_back(static_cast<char>((high << 4) | low));
                    i += 2;
                    continue;
                }
            }
            decoded.push_back(text[i]);
        }
        return decoded;
    }

    std::vector<std::string> split_path(std::string_view path)
    {
        std::vector<std::string> segments;
        while (!path.empty())
        {
            const auto slash = path.find('/');
            const auto segment = path.substr(0, slash);
            if (!segment.empty())
            {
                segments.push_back(url_decode(segment));
            }
            if (slash == std::string_view::npos)
            {
                break;
            }
            path.remove_prefix(slash + 1);
        }
        return segments;
    }

    HttpRequestParser::HttpRequestParser(std::size_t max_body_bytes) : max_body_bytes_(max_body_bytes) {}

    ParseState HttpRequestParser::feed(std::string_view data)
    {
        buffer_.append(data.data(), data.size());
        if (state_ != ParseState::Complete && state_ != ParseState::Error)
        {
            advance();
        }
        return state_;
    }

    bool HttpRequestParser::expects_continue() const
    {
        if (state_ != ParseState::Body)
        {
            return false;
        }
        const auto expect = current_.header("expect");
        return expect && to_lower(trim(*expect)) == "100-continue";
    }

    HttpRequest HttpRequestParser::take_request()
    {
        if (state_ != ParseState::Complete)
        {
            throw std::logic_error("HTTP request is not complete");
        }
        HttpRequest request = std::move(current_);
        current_ = HttpRequest{};
        buffer_.erase(0, position_);
        position_ = 0;
        header_bytes_ = 0;
        content_length_ = 0;
        state_ = ParseState::RequestLine;
        advance();
        return request;
    }

    void HttpRequestParser::advance()
    {
        while (true)
        {
            bool progressed = false;
            switch (state_)
            {
            case ParseState::RequestLine:
                progressed = parse_request_line();
                break;
            case ParseState::Headers:
                progressed = parse_header_line();
                break;
            case ParseState::Body:
                progressed = parse_body();
                break;
            case ParseState::Complete:
            case ParseState::Error:
                return;
            }
            if (!progressed)
            {
                return;
            }
        }
    }

    bool HttpRequestParser::parse_request_line()
    {
        // Tolerate stray CRLFs between pipelined requests.
        while (buffer_.compare(position_, 2, "\r\n") == 0)
        {
            position_ += 2;
        }

        const auto eol = buffer_.find("\r\n", position_);
        if (eol == std::string::npos)
        {
            if (buffer_.size() - position_ > kMaxHeaderBytes)
            {
                fail(431, "Request line too long");
            }
            return false;
        }

        const std::string_view line(buffer_.data() + position_, eol - position_);
        header_bytes_ = line.size() + 2;
        position_ = eol + 2;

        const auto first_space = line.find(' ');
        const auto second_space = first_space == std::string_view::npos ? std::string_view::npos
                                                                         : line.find(' ', first_space + 1);
        if (first_space == std::string_view::npos || second_space == std::string_view::npos ||
            line.find(' ', second_space + 1) != std::string_view::npos)
        {
            fail(400, "Invalid request line");
            return false;
        }

        const auto method = line.substr(0, first_space);
        const auto target = line.substr(first_space + 1, second_space - first_space - 1);
        const auto version = line.substr(second_space + 1);

        if (!is_token(method))
        {
            fail(400, "Invalid request method");
            return false;
        }
        if (version.substr(0, 7) != "HTTP/1.")
        {
            fail(505, "Unsupported HTTP version");
            return false;
        }
        if (target.empty() || target.front() != '/')
        {
            fail(400, "Invalid request target");
            return false;
        }

        current_.method = std::string(method);
        current_.target = std::string(target);
        current_.version = std::string(version);
        const auto question = target.find('?');
        current_.path = std::string(target.substr(0, question));
        if (question != std::string_view::npos)
        {
            current_.query = std::string(target.substr(question + 1));
        }

        state_ = ParseState::Headers;
        return true;
    }

    bool HttpRequestParser::parse_header_line()
    {
        const auto eol = buffer_.find("\r\n", position_);
        if (eol == std::string::npos)
        {
            if (header_bytes_ + (buffer_.size() - position_) > kMaxHeaderBytes)
            {
                fail(431, "Request headers too large");
            }
            return false;
        }

        const std::string_view line(buffer_.data() + position_, eol - position_);
        header_bytes_ += line.size() + 2;
        position_ = eol + 2;
        if (header_bytes_ > kMaxHeaderBytes)
        {
            fail(431, "Request headers too large");
            return false;
        }

        if (line.empty())
        {
            finish_headers();
            return state_ != ParseState::Error;
        }

        const auto colon = line.find(':');
        if (colon == std::string_view::npos)
        {
            fail(400, "Invalid header line");
            return false;
        }
        const auto name = line.substr(0, colon);
        if (!is_token(name))
        {
            fail(400, "Invalid header name");
            return false;
        }
        const auto value = trim(line.substr(colon + 1));

        auto &slot = current_.headers[to_lower(name)];
        if (!slot.empty())
        {
            slot += ", ";
        }
        slot += value;
        return true;
    }

    void HttpRequestParser::finish_headers()
    {
        if (current_.header("transfer-encoding"))
        {
            fail(501, "Transfer-Encoding is not supported; send Content-Length");
            return;
        }

        content_length_ = 0;
        if (const auto length = current_.header("content-length"))
        {
            const auto text = trim(*length);
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), content_length_);
            if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size())
            {
                fail(400, "Invalid Content-Length");
                return;
            }
        }
        if (content_length_ > max_body_bytes_)
        {
            fail(413, "Request body exceeds " + std::to_string(max_body_bytes_) + " bytes");
            return;
        }

        state_ = content_length_ > 0 ? ParseState::Body : ParseState::Complete;
    }

    bool HttpRequestParser::parse_body()
    {
        if (buffer_.size() - position_ < content_length_)
        {
            return false;
        }
        current_.body.assign(buffer_, position_, static_cast<std::size_t>(content_length_));
        position_ += static_cast<std::size_t>(content_length_);
        state_ = ParseState::Complete;
        return true;
    }

    void HttpRequestParser::fail(int status, std::string message)
    {
        state_ = ParseState::Error;
        error_status_ = status;
        error_message_ = std::move(message);
    }

} // namespace streamvault::server::http
