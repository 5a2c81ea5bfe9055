#include "streamvault/server/chunk_store.hpp"

#include <array>
#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "streamvault/crypto.hpp"
#include "streamvault/error_codes.hpp"

namespace streamvault::server
{

    namespace
    {
        constexpr std::size_t kCopyBlockSize = 64 * 1024;
    }

    ChunkStore::ChunkStore(std::filesystem::path directory) : directory_(std::move(directory))
    {
        std::filesystem::create_directories(directory_);
    }

    std::filesystem::path ChunkStore::chunk_path(const std::string &session_id, std::uint64_t index) const
    {
        return directory_ / (session_id + "_" + std::to_string(index) + ".part");
    }

    void ChunkStore::write_chunk(const std::string &session_id, std::uint64_t index,
                                 std::span<const std::byte> data) const
    {
        const auto target = chunk_path(session_id, index);
        auto staging = target;
        staging += "." + crypto::random_hex(4) + ".tmp";

        {
            std::ofstream file(staging, std::ios::binary | std::ios::trunc);
            if (!file.is_open())
            {
                throw ServiceError(ErrorCode::IOError, "Failed to open chunk file " + staging.filename().string());
            }
            file.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
            file.flush();
            if (!file)
            {
                file.close();
                std::error_code ec;
                std::filesystem::remove(staging, ec);
                throw ServiceError(ErrorCode::IOError, "Failed to write chunk " + std::to_string(index));
            }
        }

        std::error_code ec;
        std::filesystem::rename(staging, target, ec);
        if (ec)
        {
            const auto reason = ec.message();
            std::filesystem::remove(staging, ec);
            throw ServiceError(ErrorCode::IOError, "Failed to store chunk " + std::to_string(index) + ": " + reason);
        }
    }

    std::uint64_t ChunkStore::append_chunk(const std::string &session_id, std::uint64_t index,
                                           std::ostream &out) const
    {
        const auto path = chunk_path(session_id, index);
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            throw ServiceError(ErrorCode::IOError, "Missing chunk " + std::to_string(index));
        }

        std::array<char, kCopyBlockSize> buffer{};
        std::uint64_t copied = 0;
        while (in)
        {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto count = in.gcount();
            if (count <= 0)
            {
                break;
            }
            out.write(buffer.data(), count);
            if (!out)
            {
                throw ServiceError(ErrorCode::IOError, "Failed to append chunk " + std::to_string(index));
            }
            copied += static_cast<std::uint64_t>(count);
        }
        if (in.bad())
        {
            throw ServiceError(ErrorCode::IOError, "Failed to read chunk " + std::to_string(index));
        }
        return copied;
    }

    bool ChunkStore::remove_chunk(const std::string &session_id, std::uint64_t index) const
    {
        std::error_code ec;
        const bool removed = std::filesystem::remove(chunk_path(session_id, index), ec);
        if (ec)
        {
            spdlog::warn("Failed to remove chunk {} of {}: {}", index, session_id, ec.message());
        }
        return removed;
    }

    std::size_t ChunkStore::remove_older_than(std::chrono::seconds max_age,
                                              const std::function<bool(const std::string &)> &is_live,
                                              std::filesystem::file_time_type now) const
    {
        const auto cutoff = now - max_age;
        std::size_t removed = 0;
        std::error_code ec;
        for (const auto &entry : std::filesystem::directory_iterator(directory_, ec))
        {
            std::error_code entry_ec;
            if (!entry.is_regular_file(entry_ec))
            {
                continue;
            }
            const auto modified = entry.last_write_time(entry_ec);
            if (entry_ec || modified >= cutoff)
            {
                continue;
            }
            const auto name = entry.path().filename().string();
            if (is_live && is_live(name.substr(0, name.find('_'))))
            {
                continue;
            }
            if (std::filesystem::remove(entry.path(), entry_ec))
            {
                ++removed;
            }
            else if (entry_ec)
            {
                spdlog::warn("Failed to remove stale chunk {}: {}", entry.path().filename().string(), entry_ec.message());
            }
        }
        if (ec)
        {
            throw ServiceError(ErrorCode::IOError, "Failed to scan chunk directory: " + ec.message());
        }
        return removed;
    }

} // namespace streamvault::server
