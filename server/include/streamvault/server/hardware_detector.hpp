#pragma once

#include <string>
#include <string_view>

#include "streamvault/protocol.hpp"
#include "streamvault/server/process_runner.hpp"

namespace streamvault::server
{

    class CapabilityProbe
    {
    public:
        virtual ~CapabilityProbe() = default;

        // Never throws; a failed detection reports every flag false and the
        // failure text as the caveat.
        virtual protocol::HardwareSupport detect() = 0;
    };

    // Lists ffmpeg's codecs and looks for the vendor H.264 encoders.
    class FfmpegCapabilityProbe final : public CapabilityProbe
    {
    public:
        FfmpegCapabilityProbe(ProcessRunner &runner, std::string ffmpeg_path);

        protocol::HardwareSupport detect() override;

    private:
        ProcessRunner &runner_;
        std::string ffmpeg_path_;
    };

    protocol::HardwareSupport parse_codec_listing(std::string_view listing);

    std::string_view current_platform() noexcept;

    // Driver prerequisites for hardware encoding on `platform`. Diagnostic only.
    std::string_view platform_caveat(std::string_view platform) noexcept;

} // namespace streamvault::server
