#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace streamvault::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::size_t transcode_workers{2};
        std::size_t transcode_queue_limit{16};
        std::size_t max_body_bytes{64 * 1024 * 1024};
        std::chrono::seconds chunk_max_age{std::chrono::hours{24}};
        std::string ffmpeg_path{"ffmpeg"};
        std::string ffprobe_path{"ffprobe"};
        std::optional<std::filesystem::path> log_file;
        bool verbose{false};
    };

} // namespace streamvault::server
