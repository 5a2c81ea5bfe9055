#include "streamvault/server/video_catalog.hpp"

#include <algorithm>
#include <chrono>
#include <numeric>
#include <system_error>

#include <spdlog/spdlog.h>

namespace streamvault::server
{

    std::uint64_t to_unix_time(const std::filesystem::file_time_type &time)
    {
        using namespace std::chrono;
        const auto system_time = time_point_cast<seconds>(time - std::filesystem::file_time_type::clock::now() +
                                                          std::chrono::system_clock::now());
        return static_cast<std::uint64_t>(std::max<std::int64_t>(system_time.time_since_epoch().count(), 0));
    }

    VideoCatalog::VideoCatalog(const MediaStore &store) : store_(store) {}

    std::vector<protocol::MediaFile> VideoCatalog::list() const
    {
        std::vector<protocol::MediaFile> files;
        std::vector<std::filesystem::file_time_type> times;
        scan(protocol::MediaKind::Original, files, times);
        scan(protocol::MediaKind::Transcoded, files, times);

        std::vector<std::size_t> order(files.size());
        std::iota(order.begin(), order.end(), std::size_t{0});
        std::sort(order.begin(), order.end(), [&](std::size_t lhs, std::size_t rhs)
                  {
                      if (times[lhs] != times[rhs])
                      {
                          return times[lhs] > times[rhs];
                      }
                      return files[lhs].filename < files[rhs].filename; });

        std::vector<protocol::MediaFile> sorted;
        sorted.reserve(files.size());
        for (const auto index : order)
        {
            sorted.push_back(std::move(files[index]));
        }
        return sorted;
    }

    void VideoCatalog::scan(protocol::MediaKind kind, std::vector<protocol::MediaFile> &out,
                            std::vector<std::filesystem::file_time_type> &times) const
    {
        const auto directory = store_.directory_for(kind);
        std::error_code ec;
        std::filesystem::directory_iterator it(directory, ec);
        if (ec)
        {
            spdlog::warn("Cannot list {}: {}", directory.string(), ec.message());
            return;
        }

        for (const auto &entry : it)
        {
            std::error_code entry_ec;
            if (!entry.is_regular_file(entry_ec))
            {
                continue;
            }
            const auto name = entry.path().filename().string();
            if (name.empty() || name.front() == '.' || !is_supported_video(name))
            {
                continue;
            }
            const auto size = entry.file_size(entry_ec);
            if (entry_ec)
            {
                continue;
            }
            const auto modified = entry.last_write_time(entry_ec);
            if (entry_ec)
            {
                continue;
            }

            out.push_back(protocol::MediaFile{
                .filename = name,
                .url = playback_url(kind, name),
                .size = size,
                .modified = to_unix_time(modified),
                .kind = kind,
            });
            times.push_back(modified);
        }
    }

} // namespace streamvault::server
