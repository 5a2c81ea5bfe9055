#include "streamvault/server/upload_manager.hpp"

#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "streamvault/crypto.hpp"
#include "streamvault/error_codes.hpp"

namespace streamvault::server
{

    UploadManager::UploadManager(MediaStore &store, ChunkStore &chunks, UploadRegistry &registry, MediaProbe &probe,
                                 CompletionHook on_complete)
        : store_(store), chunks_(chunks), registry_(registry), probe_(probe), on_complete_(std::move(on_complete))
    {
    }

    UploadSession UploadManager::init_upload(const std::string &filename, std::int64_t file_size,
                                             std::int64_t chunk_size)
    {
        const auto sanitized = sanitize_filename(filename);
        if (sanitized.empty())
        {
            throw ServiceError(ErrorCode::InvalidArgument, "Filename is required");
        }
        if (file_size <= 0)
        {
            throw ServiceError(ErrorCode::InvalidArgument, "File size must be positive");
        }
        if (chunk_size <= 0)
        {
            throw ServiceError(ErrorCode::InvalidArgument, "Chunk size must be positive");
        }

        auto session = registry_.create(sanitized, static_cast<std::uint64_t>(file_size),
                                        static_cast<std::uint64_t>(chunk_size));
        spdlog::info("Upload session {} created for {} ({} bytes, {} chunks)", session.session_id, session.filename,
                     session.file_size, session.total_chunks);
        return session;
    }

    UploadSession UploadManager::upload_chunk(const std::string &session_id, std::uint64_t chunk_index,
                                              std::span<const std::byte> data)
    {
        const auto session = registry_.find(session_id);
        if (!session)
        {
            throw ServiceError(ErrorCode::SessionNotFound, "Upload session does not exist");
        }
        if (chunk_index >= session->total_chunks)
        {
            throw ServiceError(ErrorCode::InvalidArgument, "Chunk index out of range");
        }
        if (session->status != protocol::UploadStatus::Uploading)
        {
            throw ServiceError(ErrorCode::Busy, "Upload session is being merged");
        }

        chunks_.write_chunk(session_id, chunk_index, data);
        return registry_.record_chunk(session_id, chunk_index);
    }

    CompletedUpload UploadManager::complete_upload(const std::string &session_id, const std::string &final_filename)
    {
        const auto existing = registry_.find(session_id);
        if (!existing)
        {
            throw ServiceError(ErrorCode::SessionNotFound, "Upload session does not exist");
        }
        const auto final_path = store_.resolve_for_new_entry(
            protocol::MediaKind::Original, final_filename.empty() ? existing->filename : final_filename);

        const auto session = registry_.begin_merge(session_id);
        const auto staging = MediaStore::staging_path_for(final_path);
        try
        {
            const auto merged = merge_chunks(session, staging);
            if (merged != session.file_size)
            {
                throw ServiceError(ErrorCode::IOError, "Merged size " + std::to_string(merged) +
                                                           " does not match declared size " +
                                                           std::to_string(session.file_size));
            }
            MediaStore::publish(staging, final_path);
        }
        catch (const ServiceError &error)
        {
            std::error_code ec;
            std::filesystem::remove(staging, ec);
            registry_.abort_merge(session_id);
            spdlog::error("Merge of {} failed: {}", session_id, error.what());
            throw;
        }
        catch (const std::exception &ex)
        {
            std::error_code ec;
            std::filesystem::remove(staging, ec);
            registry_.abort_merge(session_id);
            spdlog::error("Merge of {} failed: {}", session_id, ex.what());
            throw ServiceError(ErrorCode::IOError, std::string("Merge failed: ") + ex.what());
        }

        for (std::uint64_t index = 0; index < session.total_chunks; ++index)
        {
            chunks_.remove_chunk(session_id, index);
        }
        registry_.remove(session_id);
        spdlog::info("Upload {} merged into {}", session_id, final_path.filename().string());

        CompletedUpload completed{
            .path = final_path,
            .filename = final_path.filename().string(),
            .metadata = probe_.probe(final_path),
            .playback_url = playback_url(protocol::MediaKind::Original, final_path.filename().string()),
        };

        if (on_complete_)
        {
            try
            {
                on_complete_(final_path);
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Post-upload hook failed for {}: {}", completed.filename, ex.what());
            }
        }
        return completed;
    }

    std::optional<UploadSession> UploadManager::status(const std::string &session_id) const
    {
        return registry_.find(session_id);
    }

    std::string UploadManager::store_single_upload(const std::string &original_name, std::span<const std::byte> data)
    {
        if (original_name.empty())
        {
            throw ServiceError(ErrorCode::InvalidArgument, "Filename is empty");
        }
        if (!is_supported_video(original_name))
        {
            throw ServiceError(ErrorCode::UnsupportedFormat, "Unsupported video format");
        }

        const auto extension = std::filesystem::path(sanitize_filename(original_name)).extension().string();
        const auto stored_name = crypto::random_hex(16) + extension;
        const auto final_path = store_.resolve_for_new_entry(protocol::MediaKind::Original, stored_name);
        const auto staging = MediaStore::staging_path_for(final_path);
        {
            std::ofstream out(staging, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw ServiceError(ErrorCode::IOError, "Failed to open " + staging.filename().string());
            }
            out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
            out.close();
            if (!out)
            {
                std::error_code ec;
                std::filesystem::remove(staging, ec);
                throw ServiceError(ErrorCode::IOError, "Failed to write " + stored_name);
            }
        }
        MediaStore::publish(staging, final_path);
        spdlog::info("Stored upload {} as {} ({} bytes)", original_name, stored_name, data.size());
        return stored_name;
    }

    std::size_t UploadManager::cleanup_stale_chunks(std::chrono::seconds max_age)
    {
        const auto expired = registry_.remove_older_than(max_age);
        std::size_t removed = 0;
        for (const auto &session : expired)
        {
            for (const auto index : session.received_chunks)
            {
                if (chunks_.remove_chunk(session.session_id, index))
                {
                    ++removed;
                }
            }
        }

        // Leftovers of sessions that are no longer registered.
        removed += chunks_.remove_older_than(max_age, [this](const std::string &session_id)
                                             { return registry_.find(session_id).has_value(); });
        spdlog::info("Expired {} upload sessions, removed {} stale chunk files", expired.size(), removed);
        return removed;
    }

    std::uint64_t UploadManager::merge_chunks(const UploadSession &session, const std::filesystem::path &staging)
    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw ServiceError(ErrorCode::IOError, "Failed to open " + staging.filename().string());
        }

        std::uint64_t merged = 0;
        for (std::uint64_t index = 0; index < session.total_chunks; ++index)
        {
            merged += chunks_.append_chunk(session.session_id, index, out);
        }
        out.flush();
        out.close();
        if (!out)
        {
            throw ServiceError(ErrorCode::IOError, "Failed to finish writing " + staging.filename().string());
        }
        return merged;
    }

} // namespace streamvault::server
