#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "streamvault/error_codes.hpp"
#include "streamvault/protocol.hpp"

namespace streamvault::server
{

    // Supported container extensions, lower case and without the dot.
    bool is_supported_video(std::string_view filename);

    std::string mime_type_for(const std::filesystem::path &path);

    // Reduces a client-supplied name to a single safe path component. Returns an
    // empty string when nothing usable remains.
    std::string sanitize_filename(std::string_view requested);

    std::string playback_url(protocol::MediaKind kind, std::string_view filename);

    // Owns the three flat directories under the storage root: original media,
    // transcoded derivatives and in-flight upload chunks.
    class MediaStore
    {
    public:
        explicit MediaStore(std::filesystem::path root);

        const std::filesystem::path &root() const noexcept { return root_; }
        const std::filesystem::path &videos_dir() const noexcept { return videos_; }
        const std::filesystem::path &transcoded_dir() const noexcept { return transcoded_; }
        const std::filesystem::path &temp_dir() const noexcept { return temp_; }

        std::filesystem::path directory_for(protocol::MediaKind kind) const;

        // Path of an existing media file; throws ServiceError(NotFound).
        std::filesystem::path resolve(protocol::MediaKind kind, std::string_view requested) const;

        // Path for a media file that is about to be written.
        std::filesystem::path resolve_for_new_entry(protocol::MediaKind kind, std::string_view requested) const;

        // Hidden, uniquely named sibling (same extension) used while a file is
        // being produced. The catalog never lists dot-files.
        static std::filesystem::path staging_path_for(const std::filesystem::path &final_path);

        static void publish(const std::filesystem::path &staging, const std::filesystem::path &final_path);

    private:
        std::filesystem::path root_;
        std::filesystem::path videos_;
        std::filesystem::path transcoded_;
        std::filesystem::path temp_;
    };

} // namespace streamvault::server
