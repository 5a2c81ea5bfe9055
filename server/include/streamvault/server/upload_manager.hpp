#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string>

#include "streamvault/protocol.hpp"
#include "streamvault/server/chunk_store.hpp"
#include "streamvault/server/media_probe.hpp"
#include "streamvault/server/media_store.hpp"
#include "streamvault/server/upload_registry.hpp"

namespace streamvault::server
{

    struct CompletedUpload
    {
        std::filesystem::path path;
        std::string filename;
        std::optional<protocol::MediaInfo> metadata;
        std::string playback_url;
    };

    class UploadManager
    {
    public:
        // Invoked with the merged file after every successful completion.
        using CompletionHook = std::function<void(const std::filesystem::path &)>;

        UploadManager(MediaStore &store, ChunkStore &chunks, UploadRegistry &registry, MediaProbe &probe,
                      CompletionHook on_complete = {});

        UploadSession init_upload(const std::string &filename, std::int64_t file_size, std::int64_t chunk_size);

        // Idempotent per index: a retried chunk replaces the stored fragment and
        // is counted once.
        UploadSession upload_chunk(const std::string &session_id, std::uint64_t chunk_index,
                                   std::span<const std::byte> data);

        // Concatenates the chunks in index order into the final file. On failure
        // the session stays registered so completion can be retried.
        CompletedUpload complete_upload(const std::string &session_id, const std::string &final_filename);

        std::optional<UploadSession> status(const std::string &session_id) const;

        // Stores a whole file received in one request under a random name that
        // keeps the original extension. Returns the stored name.
        std::string store_single_upload(const std::string &original_name, std::span<const std::byte> data);

        // Drops sessions idle for longer than `max_age` together with their
        // chunks, then deletes unowned chunk-store files older than `max_age`.
        // Returns the number of files deleted.
        std::size_t cleanup_stale_chunks(std::chrono::seconds max_age);

    private:
        std::uint64_t merge_chunks(const UploadSession &session, const std::filesystem::path &staging);

        MediaStore &store_;
        ChunkStore &chunks_;
        UploadRegistry &registry_;
        MediaProbe &probe_;
        CompletionHook on_complete_;
    };

} // namespace streamvault::server
