#include "streamvault/server/hardware_detector.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

namespace streamvault::server
{

    FfmpegCapabilityProbe::FfmpegCapabilityProbe(ProcessRunner &runner, std::string ffmpeg_path)
        : runner_(runner), ffmpeg_path_(std::move(ffmpeg_path)) {}

    protocol::HardwareSupport FfmpegCapabilityProbe::detect()
    {
        protocol::HardwareSupport support{};
        support.platform = std::string(current_platform());
        try
        {
            const auto result = runner_.run({ffmpeg_path_, "-hide_banner", "-codecs"}, OutputCapture::StdoutOnly);
            if (!result.succeeded())
            {
                support.caveat = ffmpeg_path_ + " -codecs exited with status " + std::to_string(result.exit_code);
                spdlog::warn("Hardware detection failed: {}", support.caveat);
                return support;
            }
            auto detected = parse_codec_listing(result.output);
            detected.platform = support.platform;
            detected.caveat = std::string(platform_caveat(support.platform));
            return detected;
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Hardware detection failed: {}", ex.what());
            support.caveat = ex.what();
            return support;
        }
    }

    protocol::HardwareSupport parse_codec_listing(std::string_view listing)
    {
        std::string lowered(listing);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });

        protocol::HardwareSupport support{};
        support.qsv = lowered.find("h264_qsv") != std::string::npos;
        support.nvenc = lowered.find("h264_nvenc") != std::string::npos;
        support.amf = lowered.find("h264_amf") != std::string::npos;
        return support;
    }

    std::string_view current_platform() noexcept
    {
#if defined(_WIN32)
        return "Windows";
#elif defined(__APPLE__)
        return "Darwin";
#elif defined(__linux__)
        return "Linux";
#else
        return "Unknown";
#endif
    }

    std::string_view platform_caveat(std::string_view platform) noexcept
    {
        if (platform == "Windows")
        {
            return "Windows requires the Intel Media SDK driver for QSV";
        }
        if (platform == "Linux")
        {
            return "Linux requires VA-API drivers for hardware encoding";
        }
        return "macOS requires VideoToolbox support";
    }

} // namespace streamvault::server
