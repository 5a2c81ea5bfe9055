#pragma once

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "streamvault/protocol.hpp"
#include "streamvault/server/hardware_detector.hpp"
#include "streamvault/server/media_probe.hpp"
#include "streamvault/server/process_runner.hpp"

namespace streamvault::server
{

    struct TranscodeJob
    {
        std::filesystem::path input;
        std::filesystem::path output;
        protocol::Codec codec{protocol::Codec::H264};
        protocol::Quality quality{protocol::Quality::Medium};
        bool prefer_hardware{true};
    };

    struct HardwarePreset
    {
        protocol::Codec codec;
        std::string_view encoder;
        std::string_view preset;
        int crf;
    };

    inline constexpr std::array<HardwarePreset, 2> kHardwarePresets{{
        {protocol::Codec::H264, "h264_qsv", "fast", 23},
        {protocol::Codec::H265, "hevc_qsv", "fast", 28},
    }};

    inline constexpr std::string_view kEncodingPreset = "fast";

    // Lower CRF means higher quality and a larger file.
    int crf_for(protocol::Quality quality) noexcept;

    std::string_view software_encoder(protocol::Codec codec) noexcept;

    // Preferred vendor encoder for `codec`, checked in QSV, NVENC, AMF order.
    std::optional<std::string_view> hardware_encoder(protocol::Codec codec, const protocol::HardwareSupport &support) noexcept;

    // "<stem>_<codec>.mp4"
    std::string derivative_filename(const std::filesystem::path &source, protocol::Codec codec);

    class Transcoder
    {
    public:
        Transcoder(ProcessRunner &runner, MediaProbe &probe, CapabilityProbe &capabilities, std::string ffmpeg_path);

        // Best-effort: reports failure through the return value and the log
        // only. On failure no output file is left behind.
        bool transcode(const TranscodeJob &job);

    private:
        bool run_encoder(const TranscodeJob &job, const std::filesystem::path &staging,
                         const std::vector<std::string> &encoder_args);

        ProcessRunner &runner_;
        MediaProbe &probe_;
        CapabilityProbe &capabilities_;
        std::string ffmpeg_path_;
    };

} // namespace streamvault::server
