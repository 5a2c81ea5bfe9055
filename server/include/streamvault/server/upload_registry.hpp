#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "streamvault/protocol.hpp"

namespace streamvault::server
{

    struct UploadSession
    {
        std::string session_id;
        std::string filename;
        std::uint64_t file_size{};
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        std::set<std::uint64_t> received_chunks;
        protocol::UploadStatus status{protocol::UploadStatus::Uploading};
        std::chrono::system_clock::time_point created_at{};
        std::chrono::system_clock::time_point last_update{};

        bool is_complete() const noexcept { return received_chunks.size() == total_chunks; }
    };

    protocol::UploadProgress to_progress(const UploadSession &session);

    // In-memory session of record for resumable uploads. Every operation holds
    // the registry mutex for a single map access only, never across file I/O.
    class UploadRegistry
    {
    public:
        UploadSession create(const std::string &filename, std::uint64_t file_size, std::uint64_t chunk_size);

        std::optional<UploadSession> find(const std::string &session_id) const;

        // Adds `index` to the received set and returns the updated session.
        // Recording the same index twice counts it once.
        UploadSession record_chunk(const std::string &session_id, std::uint64_t index);

        // Moves a fully received session to Merging. Exactly one concurrent
        // caller wins; the others see SessionNotFound or IncompleteUpload.
        UploadSession begin_merge(const std::string &session_id);

        // Returns a session claimed by begin_merge to Uploading so completion
        // can be retried.
        void abort_merge(const std::string &session_id);

        void remove(const std::string &session_id);

        // Drops sessions idle for longer than `max_age` and returns them.
        // Sessions being merged are never dropped.
        std::vector<UploadSession> remove_older_than(
            std::chrono::seconds max_age,
            std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    private:
        std::string generate_session_id(const std::string &filename, std::uint64_t file_size,
                                        std::chrono::system_clock::time_point created_at) const;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, UploadSession> sessions_;
    };

} // namespace streamvault::server
