#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <memory>
#include <thread>
#include <vector>

#include "streamvault/server/chunk_store.hpp"
#include "streamvault/server/config.hpp"
#include "streamvault/server/hardware_detector.hpp"
#include "streamvault/server/media_probe.hpp"
#include "streamvault/server/media_store.hpp"
#include "streamvault/server/process_runner.hpp"
#include "streamvault/server/transcode_queue.hpp"
#include "streamvault/server/transcoder.hpp"
#include "streamvault/server/upload_manager.hpp"
#include "streamvault/server/upload_registry.hpp"
#include "streamvault/server/video_catalog.hpp"

namespace streamvault::server
{

    class Session;

    class Server
    {
    public:
        explicit Server(ServerConfig config);
        ~Server();

        void run();

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();
        void enqueue_default_transcode(const std::filesystem::path &source);

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        MediaStore media_store_;
        ChunkStore chunk_store_;
        UploadRegistry upload_registry_;
        ShellProcessRunner process_runner_;
        FfprobeMediaProbe media_probe_;
        FfmpegCapabilityProbe capability_probe_;
        Transcoder transcoder_;
        TranscodeQueue transcode_queue_;
        UploadManager upload_manager_;
        VideoCatalog catalog_;

        std::vector<std::thread> workers_;
    };

} // namespace streamvault::server
