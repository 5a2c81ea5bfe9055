#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "streamvault/server/server.hpp"
#include "streamvault/crypto.hpp"
#include "streamvault/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "StreamVault server " << streamvault::version() << "\n"
                  << "Usage: " << program_name
                  << " --port <PORT> --root <ROOT> [--address <ADDRESS>] [--threads <N>]\n"
                     "       [--transcode-workers <N>] [--transcode-queue <N>] [--max-body <BYTES>]\n"
                     "       [--chunk-max-age <seconds>] [--ffmpeg <PATH>] [--ffprobe <PATH>]\n"
                     "       [--log <FILE>] [--verbose]\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

} // namespace

int main(int argc, char *argv[])
{
    using streamvault::server::Server;
    using streamvault::server::ServerConfig;

    ServerConfig config;

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            }
            if (arg == "--verbose")
            {
                config.verbose = true;
                continue;
            }

            const bool takes_value = arg == "--port" || arg == "--root" || arg == "--address" || arg == "--threads" ||
                                     arg == "--transcode-workers" || arg == "--transcode-queue" ||
                                     arg == "--max-body" || arg == "--chunk-max-age" || arg == "--ffmpeg" ||
                                     arg == "--ffprobe" || arg == "--log";
            if (!takes_value)
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
            auto value = read_option(i, argc, argv);
            if (!value)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }

            if (arg == "--port")
            {
                config.port = static_cast<std::uint16_t>(std::stoi(*value));
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(*value);
            }
            else if (arg == "--address")
            {
                config.address = *value;
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--transcode-workers")
            {
                config.transcode_workers = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--transcode-queue")
            {
                config.transcode_queue_limit = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--max-body")
            {
                config.max_body_bytes = static_cast<std::size_t>(std::stoull(*value));
            }
            else if (arg == "--chunk-max-age")
            {
                config.chunk_max_age = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--ffmpeg")
            {
                config.ffmpeg_path = *value;
            }
            else if (arg == "--ffprobe")
            {
                config.ffprobe_path = *value;
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(*value);
            }
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Invalid argument value: " << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.port == 0 || config.root.empty() || config.transcode_workers == 0)
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting StreamVault server {} on {}:{}", streamvault::version(), config.address, config.port);

        streamvault::crypto::ensure_sodium_init();
        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
