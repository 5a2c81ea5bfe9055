#include "streamvault/server/transcode_queue.hpp"

#include <asio/post.hpp>

#include <spdlog/spdlog.h>

namespace streamvault::server
{

    TranscodeQueue::TranscodeQueue(Transcoder &transcoder, std::size_t workers, std::size_t max_pending)
        : transcoder_(transcoder), pool_(workers == 0 ? 1 : workers), max_pending_(max_pending == 0 ? 1 : max_pending)
    {
    }

    TranscodeQueue::~TranscodeQueue()
    {
        shutdown();
    }

    bool TranscodeQueue::submit(TranscodeJob job)
    {
        {
            std::lock_guard lock(mutex_);
            if (stopped_)
            {
                spdlog::warn("Transcode queue stopped, dropping job for {}", job.input.filename().string());
                return false;
            }
            if (pending_ >= max_pending_)
            {
                spdlog::warn("Transcode queue full ({} pending), dropping job for {}", pending_,
                             job.input.filename().string());
                return false;
            }
            ++pending_;
        }
        spdlog::info("Queued transcode {} -> {} ({}, {})", job.input.filename().string(),
                     job.output.filename().string(), protocol::to_string(job.codec), protocol::to_string(job.quality));
        asio::post(pool_, [this, job = std::move(job)]
                   { run_job(job); });
        return true;
    }

    std::size_t TranscodeQueue::pending() const
    {
        std::lock_guard lock(mutex_);
        return pending_;
    }

    void TranscodeQueue::shutdown()
    {
        {
            std::lock_guard lock(mutex_);
            if (stopped_)
            {
                return;
            }
            stopped_ = true;
        }
        pool_.join();
    }

    void TranscodeQueue::run_job(const TranscodeJob &job)
    {
        try
        {
            if (!transcoder_.transcode(job))
            {
                spdlog::error("Background transcode of {} failed", job.input.filename().string());
            }
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Background transcode of {} aborted: {}", job.input.filename().string(), ex.what());
        }

        std::lock_guard lock(mutex_);
        --pending_;
    }

} // namespace streamvault::server
