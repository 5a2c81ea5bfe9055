#include "streamvault/server/session.hpp"

#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

#include "session_common.hpp"

#include <spdlog/spdlog.h>

namespace streamvault::server
{

    namespace
    {

        constexpr std::string_view kContinueResponse = "HTTP/1.1 100 Continue\r\n\r\n";

        void add_cors_headers(http::HeaderList &headers)
        {
            headers.emplace_back("Access-Control-Allow-Origin", "*");
        }

        bool is_read_method(const std::string &method)
        {
            return method == "GET" || method == "HEAD";
        }

    } // namespace

    Session::Session(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services), parser_(services.max_body_bytes),
          stream_buffer_(kStreamBlockSize)
    {
    }

    Session::~Session()
    {
        spdlog::debug("Session released");
    }

    void Session::start()
    {
        spdlog::debug("Client connected from {}", remote_endpoint());
        read_more();
    }

    void Session::stop()
    {
        if (closed_)
        {
            return;
        }
        closed_ = true;
        std::error_code ec;
        spdlog::debug("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Session::read_more()
    {
        auto self = shared_from_this();
        socket_.async_read_some(asio::buffer(read_buffer_),
                                [this, self](const std::error_code &ec, std::size_t bytes_transferred)
                                {
                                    if (ec)
                                    {
                                        if (ec != asio::error::eof && ec != asio::error::operation_aborted)
                                        {
                                            spdlog::debug("Read error from {}: {}", remote_endpoint(), ec.message());
                                        }
                                        stop();
                                        return;
                                    }
                                    parser_.feed(std::string_view(read_buffer_.data(), bytes_transferred));
                                    process_buffered();
                                });
    }

    void Session::process_buffered()
    {
        switch (parser_.state())
        {
        case http::ParseState::Error:
        {
            spdlog::debug("Rejecting malformed request from {}: {}", remote_endpoint(), parser_.error_message());
            auto response = http::HttpResponse::json(
                parser_.error_status(), protocol::make_error_body(ErrorCode::InvalidPayload, parser_.error_message()));
            send_response(std::move(response), false);
            return;
        }
        case http::ParseState::Complete:
        {
            auto request = parser_.take_request();
            continue_sent_ = false;
            dispatch(std::move(request));
            return;
        }
        case http::ParseState::Body:
            if (parser_.expects_continue() && !continue_sent_)
            {
                continue_sent_ = true;
                auto self = shared_from_this();
                asio::async_write(socket_, asio::buffer(kContinueResponse.data(), kContinueResponse.size()),
                                  [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                                  {
                                      if (ec)
                                      {
                                          stop();
                                          return;
                                      }
                                      read_more();
                                  });
                return;
            }
            read_more();
            return;
        case http::ParseState::RequestLine:
        case http::ParseState::Headers:
            read_more();
            return;
        }
    }

    void Session::dispatch(http::HttpRequest request)
    {
        const bool keep_alive = request.keep_alive();
        spdlog::debug("{} -> {} {}", remote_endpoint(), request.method, request.target);

        try
        {
            if (request.method == "OPTIONS")
            {
                auto response = http::HttpResponse::empty(204);
                response.headers.emplace_back("Access-Control-Allow-Methods", "GET, HEAD, POST, OPTIONS");
                response.headers.emplace_back("Access-Control-Allow-Headers", "Content-Type, Range");
                send_response(std::move(response), keep_alive);
                return;
            }

            auto response = route(request, keep_alive);
            if (response)
            {
                send_response(std::move(*response), keep_alive, request.method != "HEAD");
            }
        }
        catch (const ServiceError &error)
        {
            if (http_status(error.code()) >= 500)
            {
                spdlog::error("{} {} failed: {}", request.method, request.path, error.what());
            }
            send_error(error.code(), error.what(), keep_alive);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(ErrorCode::InvalidPayload, ex.what(), keep_alive);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{} {} failed: {}", request.method, request.path, ex.what());
            send_error(ErrorCode::InternalError, ex.what(), keep_alive);
        }
    }

    std::optional<http::HttpResponse> Session::route(const http::HttpRequest &request, bool keep_alive)
    {
        const auto segments = http::split_path(request.path);
        if (segments.size() < 2 || segments[0] != "api")
        {
            throw ServiceError(ErrorCode::NotFound, "Route not found");
        }
        const auto &resource = segments[1];
        const auto &method = request.method;

        if (resource == "upload" && segments.size() == 3)
        {
            const auto &action = segments[2];
            if (action == "init" || action == "chunk" || action == "complete")
            {
                if (method != "POST")
                {
                    return session_common::make_method_not_allowed("POST");
                }
                if (action == "init")
                {
                    return handle_upload_init(request);
                }
                if (action == "chunk")
                {
                    return handle_upload_chunk(request);
                }
                return handle_upload_complete(request);
            }
        }
        else if (resource == "upload" && segments.size() == 4 && segments[2] == "status")
        {
            if (!is_read_method(method))
            {
                return session_common::make_method_not_allowed("GET, HEAD");
            }
            return handle_upload_status(segments[3]);
        }
        else if (resource == "upload-video" && segments.size() == 2)
        {
            if (method != "POST")
            {
                return session_common::make_method_not_allowed("POST");
            }
            return handle_upload_video(request);
        }
        else if (resource == "videos" && segments.size() == 2)
        {
            if (!is_read_method(method))
            {
                return session_common::make_method_not_allowed("GET, HEAD");
            }
            return handle_list_videos();
        }
        else if (resource == "hardware-info" && segments.size() == 2)
        {
            if (!is_read_method(method))
            {
                return session_common::make_method_not_allowed("GET, HEAD");
            }
            return handle_hardware_info();
        }
        else if (resource == "transcode" && segments.size() == 3)
        {
            if (method != "POST")
            {
                return session_common::make_method_not_allowed("POST");
            }
            return handle_transcode(request, segments[2]);
        }
        else if (resource == "cleanup" && segments.size() == 2)
        {
            if (method != "POST")
            {
                return session_common::make_method_not_allowed("POST");
            }
            return handle_cleanup();
        }
        else if (resource == "video-detail" && (segments.size() == 3 || segments.size() == 4))
        {
            if (!is_read_method(method))
            {
                return session_common::make_method_not_allowed("GET, HEAD");
            }
            if (segments.size() == 3)
            {
                handle_stream(request, protocol::MediaKind::Original, segments[2], keep_alive);
                return std::nullopt;
            }
            if (segments[2] == "transcoded")
            {
                handle_stream(request, protocol::MediaKind::Transcoded, segments[3], keep_alive);
                return std::nullopt;
            }
        }

        throw ServiceError(ErrorCode::NotFound, "Route not found");
    }

    void Session::send_response(http::HttpResponse response, bool keep_alive, bool include_body)
    {
        add_cors_headers(response.headers);
        auto message = std::make_shared<std::string>(http::serialize(response, keep_alive, include_body));
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(*message),
                          [this, self, message, keep_alive](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  stop();
                                  return;
                              }
                              finish_request(keep_alive);
                          });
    }

    void Session::send_error(ErrorCode code, const std::string &message, bool keep_alive)
    {
        send_response(session_common::make_error_response(code, message), keep_alive);
    }

    void Session::finish_request(bool keep_alive)
    {
        if (!keep_alive)
        {
            stop();
            return;
        }
        process_buffered();
    }

    std::string Session::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace streamvault::server
