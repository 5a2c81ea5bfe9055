#include "streamvault/server/media_store.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <system_error>

#include "streamvault/crypto.hpp"

namespace streamvault::server
{

    namespace
    {
        constexpr auto kVideosDir = "videos";
        constexpr auto kTranscodedDir = "transcoded";
        constexpr auto kTempDir = "temp";

        struct ContainerType
        {
            std::string_view extension;
            std::string_view mime;
        };

        constexpr std::array<ContainerType, 8> kContainers{{
            {"mp4", "video/mp4"},
            {"webm", "video/webm"},
            {"mov", "video/quicktime"},
            {"avi", "video/x-msvideo"},
            {"mkv", "video/x-matroska"},
            {"flv", "video/x-flv"},
            {"wmv", "video/x-ms-wmv"},
            {"m4v", "video/x-m4v"},
        }};

        constexpr std::string_view kDefaultMime = "video/mp4";

        std::string lower_extension(std::string_view filename)
        {
            const auto dot = filename.rfind('.');
            if (dot == std::string_view::npos || dot + 1 >= filename.size())
            {
                return {};
            }
            std::string ext(filename.substr(dot + 1));
            std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return ext;
        }

        const ContainerType *find_container(std::string_view filename)
        {
            const auto ext = lower_extension(filename);
            for (const auto &container : kContainers)
            {
                if (container.extension == ext)
                {
                    return &container;
                }
            }
            return nullptr;
        }

        bool is_plain_component(std::string_view name)
        {
            if (name.empty() || name == "." || name == ".." || name.front() == '.')
            {
                return false;
            }
            return name.find_first_of("/\\") == std::string_view::npos && name.find('\0') == std::string_view::npos;
        }

    } // namespace

    bool is_supported_video(std::string_view filename)
    {
        return find_container(filename) != nullptr;
    }

    std::string mime_type_for(const std::filesystem::path &path)
    {
        const auto *container = find_container(path.filename().string());
        return std::string(container ? container->mime : kDefaultMime);
    }

    std::string sanitize_filename(std::string_view requested)
    {
        const auto separator = requested.find_last_of("/\\");
        if (separator != std::string_view::npos)
        {
            requested.remove_prefix(separator + 1);
        }

        std::string sanitized;
        sanitized.reserve(requested.size());
        for (const char ch : requested)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (std::isspace(c))
            {
                sanitized.push_back('_');
            }
            else if (std::isalnum(c) || c == '.' || c == '_' || c == '-')
            {
                sanitized.push_back(static_cast<char>(c));
            }
        }

        const auto first = sanitized.find_first_not_of("._");
        if (first == std::string::npos)
        {
            return {};
        }
        const auto last = sanitized.find_last_not_of("._");
        return sanitized.substr(first, last - first + 1);
    }

    std::string playback_url(protocol::MediaKind kind, std::string_view filename)
    {
        if (kind == protocol::MediaKind::Transcoded)
        {
            return "/api/video-detail/transcoded/" + std::string(filename);
        }
        return "/api/video-detail/" + std::string(filename);
    }

    MediaStore::MediaStore(std::filesystem::path root)
        : root_(std::move(root)),
          videos_(root_ / kVideosDir),
          transcoded_(root_ / kTranscodedDir),
          temp_(root_ / kTempDir)
    {
        std::filesystem::create_directories(videos_);
        std::filesystem::create_directories(transcoded_);
        std::filesystem::create_directories(temp_);
    }

    std::filesystem::path MediaStore::directory_for(protocol::MediaKind kind) const
    {
        return kind == protocol::MediaKind::Transcoded ? transcoded_ : videos_;
    }

    std::filesystem::path MediaStore::resolve(protocol::MediaKind kind, std::string_view requested) const
    {
        if (!is_plain_component(requested))
        {
            throw ServiceError(ErrorCode::NotFound, "Video file does not exist");
        }
        const auto path = directory_for(kind) / std::string(requested);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
            throw ServiceError(ErrorCode::NotFound, "Video file does not exist");
        }
        return path;
    }

    std::filesystem::path MediaStore::resolve_for_new_entry(protocol::MediaKind kind, std::string_view requested) const
    {
        const auto name = sanitize_filename(requested);
        if (name.empty())
        {
            throw ServiceError(ErrorCode::InvalidArgument, "Invalid filename");
        }
        if (!is_supported_video(name))
        {
            throw ServiceError(ErrorCode::UnsupportedFormat, "Unsupported video format: " + name);
        }
        return directory_for(kind) / name;
    }

    std::filesystem::path MediaStore::staging_path_for(const std::filesystem::path &final_path)
    {
        return final_path.parent_path() / ("." + crypto::random_hex(6) + "." + final_path.filename().string());
    }

    void MediaStore::publish(const std::filesystem::path &staging, const std::filesystem::path &final_path)
    {
        std::error_code ec;
        std::filesystem::rename(staging, final_path, ec);
        if (ec)
        {
            const auto reason = ec.message();
            std::filesystem::remove(staging, ec);
            throw ServiceError(ErrorCode::IOError, "Failed to publish " + final_path.filename().string() + ": " + reason);
        }
    }

} // namespace streamvault::server
