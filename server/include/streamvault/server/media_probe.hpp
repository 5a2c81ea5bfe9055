#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "streamvault/protocol.hpp"
#include "streamvault/server/process_runner.hpp"

namespace streamvault::server
{

    class MediaProbe
    {
    public:
        virtual ~MediaProbe() = default;

        // Metadata of the first video stream. Best-effort: failures are logged
        // and yield std::nullopt, never an exception.
        virtual std::optional<protocol::MediaInfo> probe(const std::filesystem::path &path) = 0;
    };

    class FfprobeMediaProbe final : public MediaProbe
    {
    public:
        FfprobeMediaProbe(ProcessRunner &runner, std::string ffprobe_path);

        std::optional<protocol::MediaInfo> probe(const std::filesystem::path &path) override;

    private:
        ProcessRunner &runner_;
        std::string ffprobe_path_;
    };

    // Parses `ffprobe -print_format json -show_streams -show_format` output.
    std::optional<protocol::MediaInfo> parse_ffprobe_output(std::string_view json_text);

    // "30000/1001" -> 29.97; plain numbers are accepted, 0 on anything else.
    double parse_frame_rate(std::string_view rate);

} // namespace streamvault::server
