#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

#include "streamvault/protocol.hpp"
#include "streamvault/server/media_store.hpp"

namespace streamvault::server
{

    std::uint64_t to_unix_time(const std::filesystem::file_time_type &time);

    // Read-only view over the original and transcoded directories.
    class VideoCatalog
    {
    public:
        explicit VideoCatalog(const MediaStore &store);

        // Newest first. Hidden files, directories and unsupported extensions
        // are skipped.
        std::vector<protocol::MediaFile> list() const;

    private:
        void scan(protocol::MediaKind kind, std::vector<protocol::MediaFile> &out,
                  std::vector<std::filesystem::file_time_type> &times) const;

        const MediaStore &store_;
    };

} // namespace streamvault::server
