#include "streamvault/server/session.hpp"

#include <asio/write.hpp>

#include <spdlog/spdlog.h>

#include "session_common.hpp"

namespace streamvault::server
{

    void Session::handle_stream(const http::HttpRequest &request, protocol::MediaKind kind,
                                const std::string &filename, bool keep_alive)
    {
        const auto path = services_.media_store.resolve(kind, filename);
        if (!is_supported_video(filename))
        {
            throw ServiceError(ErrorCode::UnsupportedFormat, "Unsupported video format");
        }

        auto plan = plan_stream(path, request.header("range"));
        const bool head_only = request.method == "HEAD";

        if (plan.status == 416)
        {
            spdlog::debug("Unsatisfiable range {} for {}", request.header("range").value_or(""), filename);
            auto response = session_common::make_error_response(ErrorCode::UnsatisfiableRange,
                                                                 "Requested range not satisfiable");
            response.headers.insert(response.headers.end(), plan.headers.begin(), plan.headers.end());
            send_response(std::move(response), keep_alive, !head_only);
            return;
        }

        plan.headers.emplace_back("Access-Control-Allow-Origin", "*");

        // HEAD and empty files stop after the head.
        std::shared_ptr<BlockReader> reader;
        if (!head_only && plan.length > 0)
        {
            reader = std::make_shared<BlockReader>(plan.path, plan.offset, plan.length);
        }
        auto head = std::make_shared<std::string>(
            http::format_response_head(plan.status, plan.headers, plan.length, keep_alive));

        spdlog::debug("Streaming {} [{}] {} bytes from offset {}", filename, plan.status, plan.length, plan.offset);

        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(*head),
                          [this, self, head, reader, keep_alive](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  stop();
                                  return;
                              }
                              if (!reader)
                              {
                                  finish_request(keep_alive);
                                  return;
                              }
                              stream_next_block(reader, keep_alive);
                          });
    }

    void Session::stream_next_block(std::shared_ptr<BlockReader> reader, bool keep_alive)
    {
        const auto count = reader->read_next(stream_buffer_);
        if (count == 0)
        {
            if (reader->remaining() > 0)
            {
                // The file shrank under us; the advertised length can no longer be met.
                spdlog::warn("Stream ended {} bytes short for {}", reader->remaining(), remote_endpoint());
                stop();
                return;
            }
            finish_request(keep_alive);
            return;
        }

        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(stream_buffer_.data(), count),
                          [this, self, reader, keep_alive](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  spdlog::debug("Client {} aborted stream: {}", remote_endpoint(), ec.message());
                                  stop();
                                  return;
                              }
                              stream_next_block(reader, keep_alive);
                          });
    }

} // namespace streamvault::server
