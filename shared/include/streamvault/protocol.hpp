/**
 * StreamVault - JSON schema of the HTTP API and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "streamvault/error_codes.hpp"

namespace streamvault::protocol
{

    enum class UploadStatus : std::uint8_t
    {
        Uploading,
        Merging,
        Complete,
        Failed
    };

    std::string_view to_string(UploadStatus status) noexcept;

    enum class MediaKind : std::uint8_t
    {
        Original,
        Transcoded
    };

    std::string_view to_string(MediaKind kind) noexcept;

    enum class Codec : std::uint8_t
    {
        H264,
        H265
    };

    std::string_view to_string(Codec codec) noexcept;
    std::optional<Codec> codec_from_string(std::string_view value) noexcept;

    enum class Quality : std::uint8_t
    {
        Low,
        Medium,
        High
    };

    std::string_view to_string(Quality quality) noexcept;
    std::optional<Quality> quality_from_string(std::string_view value) noexcept;

    nlohmann::json make_error_body(ErrorCode code, std::string_view message);

    struct UploadInitRequest
    {
        std::string filename;
        std::int64_t file_size{};
        std::int64_t chunk_size{};
    };

    void from_json(const nlohmann::json &json, UploadInitRequest &request);

    struct UploadProgress
    {
        std::string session_id;
        std::string filename;
        std::uint64_t file_size{};
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        std::uint64_t received_chunks{};
        std::vector<std::uint64_t> received_indices;
        UploadStatus status{UploadStatus::Uploading};
        std::uint64_t created_at{};
    };

    void to_json(nlohmann::json &json, const UploadProgress &progress);

    struct UploadInitResponse
    {
        std::string session_id;
        std::uint64_t total_chunks{};
        UploadProgress status;
    };

    void to_json(nlohmann::json &json, const UploadInitResponse &response);

    struct UploadChunkResponse
    {
        std::string session_id;
        std::uint64_t chunk_index{};
        std::uint64_t received_chunks{};
        std::uint64_t total_chunks{};
        double progress_percent{};
    };

    void to_json(nlohmann::json &json, const UploadChunkResponse &response);

    struct UploadCompleteRequest
    {
        std::string session_id;
        std::string filename;
    };

    void from_json(const nlohmann::json &json, UploadCompleteRequest &request);

    struct MediaInfo
    {
        double duration{};
        std::int64_t width{};
        std::int64_t height{};
        std::int64_t bitrate{};
        std::string codec;
        double frame_rate{};
    };

    void to_json(nlohmann::json &json, const MediaInfo &info);

    struct UploadCompleteResponse
    {
        std::string filename;
        std::optional<MediaInfo> metadata;
        std::string playback_url;
    };

    void to_json(nlohmann::json &json, const UploadCompleteResponse &response);

    struct MediaFile
    {
        std::string filename;
        std::string url;
        std::uint64_t size{};
        std::uint64_t modified{};
        MediaKind kind{MediaKind::Original};
    };

    void to_json(nlohmann::json &json, const MediaFile &file);

    struct HardwareSupport
    {
        bool qsv{};
        bool nvenc{};
        bool amf{};
        std::string platform;
        std::string caveat;
    };

    void to_json(nlohmann::json &json, const HardwareSupport &support);

    struct TranscodeRequest
    {
        Codec codec{Codec::H264};
        Quality quality{Quality::Medium};
        bool prefer_hardware{true};
    };

    // Missing fields take their defaults; unknown codec or quality names throw
    // ServiceError(InvalidArgument).
    void from_json(const nlohmann::json &json, TranscodeRequest &request);

    struct TranscodeAccepted
    {
        std::string output_filename;
        Codec codec{Codec::H264};
        Quality quality{Quality::Medium};
    };

    void to_json(nlohmann::json &json, const TranscodeAccepted &accepted);

} // namespace streamvault::protocol
