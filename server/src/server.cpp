#include "streamvault/server/server.hpp"

#include <asio/ip/address.hpp>

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "streamvault/server/session.hpp"

namespace streamvault::server
{

    namespace
    {

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          media_store_(config_.root),
          chunk_store_(media_store_.temp_dir()),
          media_probe_(process_runner_, config_.ffprobe_path),
          capability_probe_(process_runner_, config_.ffmpeg_path),
          transcoder_(process_runner_, media_probe_, capability_probe_, config_.ffmpeg_path),
          transcode_queue_(transcoder_, config_.transcode_workers, config_.transcode_queue_limit),
          upload_manager_(media_store_, chunk_store_, upload_registry_, media_probe_,
                          [this](const std::filesystem::path &source)
                          { enqueue_default_transcode(source); }),
          catalog_(media_store_)
    {
        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} with root {}", config_.address, config_.port, config_.root.string());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    Server::~Server()
    {
        transcode_queue_.shutdown();
    }

    void Server::run()
    {
        accept_next();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads, {} transcode workers", worker_count,
                     config_.transcode_workers);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }

        if (transcode_queue_.pending() > 0)
        {
            spdlog::info("Waiting for {} transcode jobs to finish", transcode_queue_.pending());
        }
        transcode_queue_.shutdown();
    }

    void Server::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            ServerServices services{
                .media_store = media_store_,
                .uploads = upload_manager_,
                .catalog = catalog_,
                .transcode_queue = transcode_queue_,
                .capabilities = capability_probe_,
                .max_body_bytes = config_.max_body_bytes,
                .chunk_max_age = config_.chunk_max_age,
            };
            auto session = std::make_shared<Session>(std::move(socket), services);
            session->start();
            spdlog::debug("Accepted new connection");
        }
        if (!ec || ec == asio::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::handle_signal()
    {
        std::error_code ec;
        acceptor_.close(ec);
        io_context_.stop();
        spdlog::info("Signal received, shutting down");
    }

    void Server::enqueue_default_transcode(const std::filesystem::path &source)
    {
        TranscodeJob job{
            .input = source,
            .output = media_store_.transcoded_dir() / derivative_filename(source, protocol::Codec::H264),
            .codec = protocol::Codec::H264,
            .quality = protocol::Quality::Medium,
            .prefer_hardware = true,
        };
        if (!transcode_queue_.submit(std::move(job)))
        {
            spdlog::warn("Skipping default transcode of {}", source.filename().string());
        }
    }

} // namespace streamvault::server
