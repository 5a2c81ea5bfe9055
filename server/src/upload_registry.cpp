#include "streamvault/server/upload_registry.hpp"

#include "streamvault/crypto.hpp"
#include "streamvault/error_codes.hpp"

namespace streamvault::server
{

    namespace
    {
        constexpr std::size_t kSessionIdLength = 32;

        std::uint64_t to_unix_seconds(std::chrono::system_clock::time_point time)
        {
            return static_cast<std::uint64_t>(
                std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count());
        }
    } // namespace

    protocol::UploadProgress to_progress(const UploadSession &session)
    {
        return protocol::UploadProgress{
            .session_id = session.session_id,
            .filename = session.filename,
            .file_size = session.file_size,
            .chunk_size = session.chunk_size,
            .total_chunks = session.total_chunks,
            .received_chunks = static_cast<std::uint64_t>(session.received_chunks.size()),
            .received_indices = {session.received_chunks.begin(), session.received_chunks.end()},
            .status = session.status,
            .created_at = to_unix_seconds(session.created_at),
        };
    }

    UploadSession UploadRegistry::create(const std::string &filename, std::uint64_t file_size,
                                         std::uint64_t chunk_size)
    {
        if (chunk_size == 0)
        {
            throw ServiceError(ErrorCode::InvalidArgument, "Chunk size must be positive");
        }

        UploadSession session{};
        session.filename = filename;
        session.file_size = file_size;
        session.chunk_size = chunk_size;
        session.total_chunks = (file_size + chunk_size - 1) / chunk_size;
        session.status = protocol::UploadStatus::Uploading;
        session.created_at = std::chrono::system_clock::now();
        session.last_update = session.created_at;

        auto candidate = generate_session_id(filename, file_size, session.created_at);
        std::lock_guard lock(mutex_);
        while (sessions_.contains(candidate))
        {
            candidate = generate_session_id(filename, file_size, session.created_at);
        }
        session.session_id = candidate;
        sessions_[session.session_id] = session;
        return session;
    }

    std::optional<UploadSession> UploadRegistry::find(const std::string &session_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    UploadSession UploadRegistry::record_chunk(const std::string &session_id, std::uint64_t index)
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end())
        {
            throw ServiceError(ErrorCode::SessionNotFound, "Upload session does not exist");
        }
        auto &session = it->second;
        if (session.status != protocol::UploadStatus::Uploading)
        {
            throw ServiceError(ErrorCode::Busy, "Upload session is being merged");
        }
        if (index >= session.total_chunks)
        {
            throw ServiceError(ErrorCode::InvalidArgument, "Chunk index out of range");
        }
        session.received_chunks.insert(index);
        session.last_update = std::chrono::system_clock::now();
        return session;
    }

    UploadSession UploadRegistry::begin_merge(const std::string &session_id)
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end())
        {
            throw ServiceError(ErrorCode::SessionNotFound, "Upload session does not exist");
        }
        auto &session = it->second;
        if (session.status == protocol::UploadStatus::Merging)
        {
            throw ServiceError(ErrorCode::SessionNotFound, "Upload session is already being completed");
        }
        if (!session.is_complete())
        {
            throw ServiceError(ErrorCode::IncompleteUpload,
                               "Upload incomplete: " + std::to_string(session.received_chunks.size()) + "/" +
                                   std::to_string(session.total_chunks) + " chunks received");
        }
        session.status = protocol::UploadStatus::Merging;
        return session;
    }

    void UploadRegistry::abort_merge(const std::string &session_id)
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end())
        {
            it->second.status = protocol::UploadStatus::Uploading;
        }
    }

    void UploadRegistry::remove(const std::string &session_id)
    {
        std::lock_guard lock(mutex_);
        sessions_.erase(session_id);
    }

    std::vector<UploadSession> UploadRegistry::remove_older_than(std::chrono::seconds max_age,
                                                                 std::chrono::system_clock::time_point now)
    {
        std::vector<UploadSession> expired;
        std::lock_guard lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();)
        {
            if (it->second.status != protocol::UploadStatus::Merging && now - it->second.last_update > max_age)
            {
                expired.push_back(std::move(it->second));
                it = sessions_.erase(it);
            }
            else
            {
                ++it;
            }
        }
        return expired;
    }

    std::string UploadRegistry::generate_session_id(const std::string &filename, std::uint64_t file_size,
                                                    std::chrono::system_clock::time_point created_at) const
    {
        const auto stamp = std::chrono::duration_cast<std::chrono::nanoseconds>(created_at.time_since_epoch()).count();
        const auto material = filename + "_" + std::to_string(file_size) + "_" + std::to_string(stamp) + "_" +
                              crypto::random_hex(8);
        return crypto::hash_text(material).substr(0, kSessionIdLength);
    }

} // namespace streamvault::server
