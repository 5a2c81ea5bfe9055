#include "streamvault/protocol.hpp"

#include <array>

namespace streamvault::protocol
{

    namespace
    {

        template <typename Enum>
        struct EnumMapping
        {
            Enum value;
            std::string_view label;
        };

        constexpr std::array<EnumMapping<UploadStatus>, 4> kUploadStatusMappings{{
            {UploadStatus::Uploading, "uploading"},
            {UploadStatus::Merging, "merging"},
            {UploadStatus::Complete, "complete"},
            {UploadStatus::Failed, "failed"},
        }};

        constexpr std::array<EnumMapping<MediaKind>, 2> kMediaKindMappings{{
            {MediaKind::Original, "original"},
            {MediaKind::Transcoded, "transcoded"},
        }};

        constexpr std::array<EnumMapping<Codec>, 2> kCodecMappings{{
            {Codec::H264, "h264"},
            {Codec::H265, "h265"},
        }};

        constexpr std::array<EnumMapping<Quality>, 3> kQualityMappings{{
            {Quality::Low, "low"},
            {Quality::Medium, "medium"},
            {Quality::High, "high"},
        }};

        template <typename Enum, std::size_t N>
        std::string_view label_of(const std::array<EnumMapping<Enum>, N> &mappings, Enum value) noexcept
        {
            for (const auto &mapping : mappings)
            {
                if (mapping.value == value)
                {
                    return mapping.label;
                }
            }
            return "unknown";
        }

        template <typename Enum, std::size_t N>
        std::optional<Enum> value_of(const std::array<EnumMapping<Enum>, N> &mappings, std::string_view label) noexcept
        {
            for (const auto &mapping : mappings)
            {
                if (mapping.label == label)
                {
                    return mapping.value;
                }
            }
            return std::nullopt;
        }

    } // namespace

    std::string_view to_string(UploadStatus status) noexcept
    {
        return label_of(kUploadStatusMappings, status);
    }

    std::string_view to_string(MediaKind kind) noexcept
    {
        return label_of(kMediaKindMappings, kind);
    }

    std::string_view to_string(Codec codec) noexcept
    {
        return label_of(kCodecMappings, codec);
    }

    std::optional<Codec> codec_from_string(std::string_view value) noexcept
    {
        return value_of(kCodecMappings, value);
    }

    std::string_view to_string(Quality quality) noexcept
    {
        return label_of(kQualityMappings, quality);
    }

    std::optional<Quality> quality_from_string(std::string_view value) noexcept
    {
        return value_of(kQualityMappings, value);
    }

    nlohmann::json make_error_body(ErrorCode code, std::string_view message)
    {
        return {
            {"error", std::string(message)},
            {"code", std::string(to_string(code))},
        };
    }

    void from_json(const nlohmann::json &json, UploadInitRequest &request)
    {
        constexpr std::int64_t kDefaultChunkSize = 1024 * 1024;
        request.filename = json.value("filename", std::string{});
        request.file_size = json.value("fileSize", std::int64_t{0});
        request.chunk_size = json.value("chunkSize", kDefaultChunkSize);
    }

    void to_json(nlohmann::json &json, const UploadProgress &progress)
    {
        json = {
            {"sessionId", progress.session_id},
            {"filename", progress.filename},
            {"fileSize", progress.file_size},
            {"chunkSize", progress.chunk_size},
            {"totalChunks", progress.total_chunks},
            {"receivedChunks", progress.received_chunks},
            {"receivedIndices", progress.received_indices},
            {"status", to_string(progress.status)},
            {"createdAt", progress.created_at},
        };
    }

    void to_json(nlohmann::json &json, const UploadInitResponse &response)
    {
        json = {
            {"sessionId", response.session_id},
            {"totalChunks", response.total_chunks},
            {"status", response.status},
        };
    }

    void to_json(nlohmann::json &json, const UploadChunkResponse &response)
    {
        json = {
            {"success", true},
            {"sessionId", response.session_id},
            {"chunkIndex", response.chunk_index},
            {"receivedChunks", response.received_chunks},
            {"totalChunks", response.total_chunks},
            {"progressPercent", response.progress_percent},
        };
    }

    void from_json(const nlohmann::json &json, UploadCompleteRequest &request)
    {
        // "fileId" and "finalFilename" are accepted from older clients.
        request.session_id = json.value("sessionId", json.value("fileId", std::string{}));
        request.filename = json.value("filename", json.value("finalFilename", std::string{}));
    }

    void to_json(nlohmann::json &json, const MediaInfo &info)
    {
        json = {
            {"duration", info.duration},
            {"width", info.width},
            {"height", info.height},
            {"bitrate", info.bitrate},
            {"codec", info.codec},
            {"fps", info.frame_rate},
        };
    }

    void to_json(nlohmann::json &json, const UploadCompleteResponse &response)
    {
        json = {
            {"success", true},
            {"filename", response.filename},
            {"metadata", response.metadata ? nlohmann::json(*response.metadata) : nlohmann::json::object()},
            {"playbackUrl", response.playback_url},
        };
    }

    void to_json(nlohmann::json &json, const MediaFile &file)
    {
        json = {
            {"filename", file.filename},
            {"url", file.url},
            {"size", file.size},
            {"modified", file.modified},
            {"type", to_string(file.kind)},
            {"transcoded", file.kind == MediaKind::Transcoded},
        };
    }

    void to_json(nlohmann::json &json, const HardwareSupport &support)
    {
        json = {
            {"qsv", support.qsv},
            {"nvenc", support.nvenc},
            {"amf", support.amf},
            {"platform", support.platform},
            {"caveat", support.caveat},
        };
    }

    void from_json(const nlohmann::json &json, TranscodeRequest &request)
    {
        const auto codec_label = json.value("codec", std::string{"h264"});
        const auto codec = codec_from_string(codec_label);
        if (!codec)
        {
            throw ServiceError(ErrorCode::InvalidArgument, "Unsupported codec: " + codec_label);
        }
        const auto quality_label = json.value("quality", std::string{"medium"});
        const auto quality = quality_from_string(quality_label);
        if (!quality)
        {
            throw ServiceError(ErrorCode::InvalidArgument, "Unsupported quality: " + quality_label);
        }
        request.codec = *codec;
        request.quality = *quality;
        request.prefer_hardware = json.value("hardware", true);
    }

    void to_json(nlohmann::json &json, const TranscodeAccepted &accepted)
    {
        json = {
            {"success", true},
            {"outputFilename", accepted.output_filename},
            {"codec", to_string(accepted.codec)},
            {"quality", to_string(accepted.quality)},
            {"message", "Transcode job queued"},
        };
    }

} // namespace streamvault::protocol
