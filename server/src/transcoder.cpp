#include "streamvault/server/transcoder.hpp"

#include <system_error>

#include <spdlog/spdlog.h>

#include "streamvault/server/media_store.hpp"

namespace streamvault::server
{

    namespace
    {

        bool non_empty_file(const std::filesystem::path &path)
        {
            std::error_code ec;
            const auto size = std::filesystem::file_size(path, ec);
            return !ec && size > 0;
        }

        void remove_quietly(const std::filesystem::path &path)
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }

        std::string tail(const std::string &output, std::size_t limit = 512)
        {
            return output.size() <= limit ? output : output.substr(output.size() - limit);
        }

    } // namespace

    int crf_for(protocol::Quality quality) noexcept
    {
        switch (quality)
        {
        case protocol::Quality::Low:
            return 18;
        case protocol::Quality::High:
            return 28;
        case protocol::Quality::Medium:
        default:
            return 23;
        }
    }

    std::string_view software_encoder(protocol::Codec codec) noexcept
    {
        return codec == protocol::Codec::H265 ? "libx265" : "libx264";
    }

    std::optional<std::string_view> hardware_encoder(protocol::Codec codec,
                                                     const protocol::HardwareSupport &support) noexcept
    {
        const bool hevc = codec == protocol::Codec::H265;
        if (support.qsv)
        {
            return hevc ? "hevc_qsv" : "h264_qsv";
        }
        if (support.nvenc)
        {
            return hevc ? "hevc_nvenc" : "h264_nvenc";
        }
        if (support.amf)
        {
            return hevc ? "hevc_amf" : "h264_amf";
        }
        return std::nullopt;
    }

    std::string derivative_filename(const std::filesystem::path &source, protocol::Codec codec)
    {
        return source.stem().string() + "_" + std::string(protocol::to_string(codec)) + ".mp4";
    }

    Transcoder::Transcoder(ProcessRunner &runner, MediaProbe &probe, CapabilityProbe &capabilities,
                           std::string ffmpeg_path)
        : runner_(runner), probe_(probe), capabilities_(capabilities), ffmpeg_path_(std::move(ffmpeg_path)) {}

    bool Transcoder::transcode(const TranscodeJob &job)
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(job.input, ec))
        {
            spdlog::error("Transcode input does not exist: {}", job.input.string());
            return false;
        }
        if (!probe_.probe(job.input))
        {
            spdlog::error("Transcode input is not a readable video: {}", job.input.string());
            return false;
        }

        std::filesystem::create_directories(job.output.parent_path(), ec);
        if (ec)
        {
            spdlog::error("Cannot create {}: {}", job.output.parent_path().string(), ec.message());
            return false;
        }
        const auto staging = MediaStore::staging_path_for(job.output);

        if (job.prefer_hardware)
        {
            const auto support = capabilities_.detect();
            if (const auto encoder = hardware_encoder(job.codec, support))
            {
                spdlog::info("Trying hardware encoder {} for {}", *encoder, job.input.filename().string());
                if (run_encoder(job, staging, {"-c:v", std::string(*encoder), "-preset", std::string(kEncodingPreset)}))
                {
                    spdlog::info("Hardware transcode finished: {} -> {}", job.input.filename().string(),
                                 job.output.filename().string());
                    return true;
                }
                spdlog::warn("Hardware encoder {} failed for {}, falling back to software", *encoder,
                             job.input.filename().string());
            }
        }

        const auto encoder = software_encoder(job.codec);
        spdlog::info("Using software encoder {} (crf {}) for {}", encoder, crf_for(job.quality),
                     job.input.filename().string());
        if (run_encoder(job, staging,
                        {"-c:v", std::string(encoder), "-crf", std::to_string(crf_for(job.quality)), "-preset",
                         std::string(kEncodingPreset)}))
        {
            spdlog::info("Software transcode finished: {} -> {} ({} bytes)", job.input.filename().string(),
                         job.output.filename().string(), std::filesystem::file_size(job.output, ec));
            return true;
        }

        spdlog::error("Transcode failed: {} -> {}", job.input.filename().string(), job.output.filename().string());
        return false;
    }

    bool Transcoder::run_encoder(const TranscodeJob &job, const std::filesystem::path &staging,
                                 const std::vector<std::string> &encoder_args)
    {
        std::vector<std::string> argv{ffmpeg_path_, "-hide_banner", "-nostdin", "-y", "-i", job.input.string()};
        argv.insert(argv.end(), encoder_args.begin(), encoder_args.end());
        argv.insert(argv.end(), {"-movflags", "+faststart", "-threads", "0", staging.string()});

        try
        {
            const auto result = runner_.run(argv, OutputCapture::StdoutAndStderr);
            if (!result.succeeded())
            {
                spdlog::warn("ffmpeg exited with status {}: {}", result.exit_code, tail(result.output));
                remove_quietly(staging);
                return false;
            }
            if (!non_empty_file(staging))
            {
                spdlog::warn("ffmpeg produced no output for {}", job.input.filename().string());
                remove_quietly(staging);
                return false;
            }
            MediaStore::publish(staging, job.output);
            return true;
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("ffmpeg run failed: {}", ex.what());
            remove_quietly(staging);
            return false;
        }
    }

} // namespace streamvault::server
