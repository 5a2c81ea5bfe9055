#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <ostream>
#include <span>
#include <string>

namespace streamvault::server
{

    // Flat directory of in-flight upload fragments named {session}_{index}.part.
    class ChunkStore
    {
    public:
        explicit ChunkStore(std::filesystem::path directory);

        const std::filesystem::path &directory() const noexcept { return directory_; }

        std::filesystem::path chunk_path(const std::string &session_id, std::uint64_t index) const;

        // Replaces any earlier fragment stored for the same index.
        void write_chunk(const std::string &session_id, std::uint64_t index, std::span<const std::byte> data) const;

        // Copies the fragment onto `out` in fixed-size blocks and returns the
        // number of bytes copied.
        std::uint64_t append_chunk(const std::string &session_id, std::uint64_t index, std::ostream &out) const;

        // Returns true when a fragment was deleted.
        bool remove_chunk(const std::string &session_id, std::uint64_t index) const;

        // Deletes files older than `max_age` unless `is_live` accepts the
        // session id their name starts with.
        std::size_t remove_older_than(std::chrono::seconds max_age,
                                      const std::function<bool(const std::string &)> &is_live,
                                      std::filesystem::file_time_type now = std::filesystem::file_time_type::clock::now()) const;

    private:
        std::filesystem::path directory_;
    };

} // namespace streamvault::server
