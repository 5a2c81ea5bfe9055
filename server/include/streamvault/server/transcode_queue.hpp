#pragma once

#include <cstddef>
#include <mutex>

#include <asio/thread_pool.hpp>

#include "streamvault/server/transcoder.hpp"

namespace streamvault::server
{

    // Fire-and-forget background transcoding on a fixed worker pool. Callers get
    // no job handle; a finished job is only visible as a new catalog entry.
    class TranscodeQueue
    {
    public:
        TranscodeQueue(Transcoder &transcoder, std::size_t workers, std::size_t max_pending);
        ~TranscodeQueue();

        TranscodeQueue(const TranscodeQueue &) = delete;
        TranscodeQueue &operator=(const TranscodeQueue &) = delete;

        // False when the pending limit is reached or the queue is shut down.
        bool submit(TranscodeJob job);

        std::size_t pending() const;

        // Stops accepting jobs and waits for the queued ones to finish.
        void shutdown();

    private:
        void run_job(const TranscodeJob &job);

        Transcoder &transcoder_;
        asio::thread_pool pool_;
        std::size_t max_pending_;

        mutable std::mutex mutex_;
        std::size_t pending_{0};
        bool stopped_{false};
    };

} // namespace streamvault::server
