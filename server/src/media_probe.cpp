#include "streamvault/server/media_probe.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace streamvault::server
{

    namespace
    {

        // ffprobe reports most numeric stream fields as JSON strings.
        // Anything that is not a finite number reads as 0.
        double number_field(const nlohmann::json &object, const char *key)
        {
            auto it = object.find(key);
            if (it == object.end() || it->is_null())
            {
                return 0.0;
            }
            double value = 0.0;
            if (it->is_number())
            {
                value = it->get<double>();
            }
            else if (it->is_string())
            {
                const auto text = it->get<std::string>();
                char *end = nullptr;
                value = std::strtod(text.c_str(), &end);
                if (end == text.c_str())
                {
                    return 0.0;
                }
            }
            return std::isfinite(value) ? value : 0.0;
        }

        std::int64_t integer_field(const nlohmann::json &object, const char *key)
        {
            // 2^63; every double below it converts without overflow.
            constexpr double kLimit = 9223372036854775808.0;
            const double value = number_field(object, key);
            if (value < -kLimit || value >= kLimit)
            {
                return 0;
            }
            return static_cast<std::int64_t>(value);
        }

    } // namespace

    FfprobeMediaProbe::FfprobeMediaProbe(ProcessRunner &runner, std::string ffprobe_path)
        : runner_(runner), ffprobe_path_(std::move(ffprobe_path)) {}

    std::optional<protocol::MediaInfo> FfprobeMediaProbe::probe(const std::filesystem::path &path)
    {
        try
        {
            const auto result = runner_.run({ffprobe_path_, "-v", "error", "-print_format", "json", "-show_streams",
                                             "-show_format", path.string()},
                                            OutputCapture::StdoutOnly);
            if (!result.succeeded())
            {
                spdlog::warn("ffprobe exited with status {} for {}", result.exit_code, path.filename().string());
                return std::nullopt;
            }
            auto info = parse_ffprobe_output(result.output);
            if (!info)
            {
                spdlog::warn("No video stream found in {}", path.filename().string());
            }
            return info;
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Failed to probe {}: {}", path.filename().string(), ex.what());
            return std::nullopt;
        }
    }

    std::optional<protocol::MediaInfo> parse_ffprobe_output(std::string_view json_text)
    {
        const auto document = nlohmann::json::parse(json_text, nullptr, false);
        if (document.is_discarded() || !document.is_object())
        {
            return std::nullopt;
        }
        const auto streams = document.find("streams");
        if (streams == document.end() || !streams->is_array())
        {
            return std::nullopt;
        }

        const nlohmann::json *video = nullptr;
        for (const auto &stream : *streams)
        {
            if (stream.is_object() && stream.value("codec_type", std::string{}) == "video")
            {
                video = &stream;
                break;
            }
        }
        if (!video)
        {
            return std::nullopt;
        }

        const auto format = document.value("format", nlohmann::json::object());

        protocol::MediaInfo info{};
        info.duration = number_field(*video, "duration");
        if (info.duration <= 0.0)
        {
            info.duration = number_field(format, "duration");
        }
        info.width = integer_field(*video, "width");
        info.height = integer_field(*video, "height");
        info.bitrate = integer_field(*video, "bit_rate");
        if (info.bitrate <= 0)
        {
            info.bitrate = integer_field(format, "bit_rate");
        }
        info.codec = video->value("codec_name", std::string{});
        info.frame_rate = parse_frame_rate(video->value("r_frame_rate", std::string{"0/1"}));
        return info;
    }

    double parse_frame_rate(std::string_view rate)
    {
        const auto slash = rate.find('/');
        const auto numerator_text = rate.substr(0, slash);
        double numerator = 0.0;
        if (std::from_chars(numerator_text.data(), numerator_text.data() + numerator_text.size(), numerator).ec !=
            std::errc{})
        {
            return 0.0;
        }
        if (slash == std::string_view::npos)
        {
            return numerator;
        }
        const auto denominator_text = rate.substr(slash + 1);
        double denominator = 0.0;
        if (std::from_chars(denominator_text.data(), denominator_text.data() + denominator_text.size(), denominator)
                    .ec != std::errc{} ||
            denominator == 0.0)
        {
            return 0.0;
        }
        return numerator / denominator;
    }

} // namespace streamvault::server
