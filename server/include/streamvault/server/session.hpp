#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "streamvault/error_codes.hpp"
#include "streamvault/protocol.hpp"
#include "streamvault/server/hardware_detector.hpp"
#include "streamvault/server/http.hpp"
#include "streamvault/server/media_store.hpp"
#include "streamvault/server/range_streamer.hpp"
#include "streamvault/server/transcode_queue.hpp"
#include "streamvault/server/upload_manager.hpp"
#include "streamvault/server/video_catalog.hpp"

namespace streamvault::server
{

    struct ServerServices
    {
        MediaStore &media_store;
        UploadManager &uploads;
        VideoCatalog &catalog;
        TranscodeQueue &transcode_queue;
        CapabilityProbe &capabilities;
        std::size_t max_body_bytes;
        std::chrono::seconds chunk_max_age;
    };

    // One HTTP/1.1 connection. Requests are handled strictly one after
    // another, so at most one read or write is outstanding at any time.
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, ServerServices services);
        ~Session();

        void start();

        void stop();

    private:
        void read_more();
        void process_buffered();
        void dispatch(http::HttpRequest request);
        std::optional<http::HttpResponse> route(const http::HttpRequest &request, bool keep_alive);
        void send_response(http::HttpResponse response, bool keep_alive, bool include_body = true);
        void send_error(ErrorCode code, const std::string &message, bool keep_alive);
        void finish_request(bool keep_alive);

        // Upload handlers
        http::HttpResponse handle_upload_init(const http::HttpRequest &request);
        http::HttpResponse handle_upload_chunk(const http::HttpRequest &request);
        http::HttpResponse handle_upload_complete(const http::HttpRequest &request);
        http::HttpResponse handle_upload_status(const std::string &session_id);
        http::HttpResponse handle_upload_video(const http::HttpRequest &request);

        // Media handlers
        http::HttpResponse handle_list_videos();
        http::HttpResponse handle_hardware_info();
        http::HttpResponse handle_transcode(const http::HttpRequest &request, const std::string &filename);
        http::HttpResponse handle_cleanup();

        // Streaming
        void handle_stream(const http::HttpRequest &request, protocol::MediaKind kind, const std::string &filename,
                           bool keep_alive);
        void stream_next_block(std::shared_ptr<BlockReader> reader, bool keep_alive);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;
        http::HttpRequestParser parser_;
        std::array<char, 16 * 1024> read_buffer_{};
        std::vector<char> stream_buffer_;
        bool continue_sent_{false};
        bool closed_{false};
    };

} // namespace streamvault::server
