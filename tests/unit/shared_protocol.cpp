#include <array>
#include <cassert>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "streamvault/crypto.hpp"
#include "streamvault/error_codes.hpp"
#include "streamvault/protocol.hpp"

using namespace streamvault;
using namespace streamvault::protocol;

void run_server_component_tests();
void run_media_pipeline_tests();
void run_http_parsing_tests();
void run_session_route_tests();

namespace
{

    void test_error_codes()
    {
        assert(to_string(ErrorCode::SessionNotFound) == "session_not_found");
        assert(to_string(ErrorCode::UnsatisfiableRange) == "unsatisfiable_range");

        assert(http_status(ErrorCode::InvalidArgument) == 400);
        assert(http_status(ErrorCode::InvalidPayload) == 400);
        assert(http_status(ErrorCode::UnsupportedFormat) == 400);
        assert(http_status(ErrorCode::SessionNotFound) == 404);
        assert(http_status(ErrorCode::NotFound) == 404);
        assert(http_status(ErrorCode::UnsatisfiableRange) == 416);
        assert(http_status(ErrorCode::Busy) == 503);
        assert(http_status(ErrorCode::IncompleteUpload) == 500);
        assert(http_status(ErrorCode::IOError) == 500);

        const ServiceError error(ErrorCode::IOError, "disk full");
        assert(error.code() == ErrorCode::IOError);
        assert(std::string(error.what()) == "disk full");

        const auto body = make_error_body(ErrorCode::NotFound, "missing");
        assert(body.at("error") == "missing");
        assert(body.at("code") == "not_found");
    }

    void test_enum_labels()
    {
        assert(codec_from_string("h265") == Codec::H265);
        assert(!codec_from_string("vp9"));
        assert(quality_from_string("low") == Quality::Low);
        assert(!quality_from_string("ultra"));
        assert(to_string(Quality::High) == "high");
        assert(to_string(MediaKind::Transcoded) == "transcoded");
        assert(to_string(UploadStatus::Merging) == "merging");
    }

    void test_upload_init_request()
    {
        const auto full = nlohmann::json{{"filename", "clip.mp4"}, {"fileSize", 5000}, {"chunkSize", 1000}}
                              .get<UploadInitRequest>();
        assert(full.filename == "clip.mp4");
        assert(full.file_size == 5000);
        assert(full.chunk_size == 1000);

        const auto defaulted = nlohmann::json{{"filename", "clip.mp4"}, {"fileSize", 10}}.get<UploadInitRequest>();
        assert(defaulted.chunk_size == 1024 * 1024);

        const auto empty = nlohmann::json::object().get<UploadInitRequest>();
        assert(empty.filename.empty());
        assert(empty.file_size == 0);
    }

    void test_upload_progress_serialization()
    {
        UploadProgress progress{
            .session_id = "abc123",
            .filename = "clip.mp4",
            .file_size = 2500,
            .chunk_size = 1000,
            .total_chunks = 3,
            .received_chunks = 2,
            .received_indices = {0, 2},
            .status = UploadStatus::Uploading,
            .created_at = 1700000000,
        };

        const nlohmann::json json = progress;
        assert(json.at("sessionId") == "abc123");
        assert(json.at("receivedChunks") == 2);
        assert(json.at("totalChunks") == 3);
        assert(json.at("receivedIndices") == nlohmann::json::array({0, 2}));
        assert(json.at("status") == "uploading");

        assert(json.at("createdAt") == 1700000000);
        assert(json.at("chunkSize") == 1000);
    }

    void test_upload_complete_payloads()
    {
        const auto current = nlohmann::json{{"sessionId", "s1"}, {"filename", "final.mp4"}}.get<UploadCompleteRequest>();
        assert(current.session_id == "s1");
        assert(current.filename == "final.mp4");

        const auto legacy =
            nlohmann::json{{"fileId", "s2"}, {"finalFilename", "other.mkv"}}.get<UploadCompleteRequest>();
        assert(legacy.session_id == "s2");
        assert(legacy.filename == "other.mkv");

        UploadCompleteResponse without_metadata{
            .filename = "final.mp4",
            .metadata = std::nullopt,
            .playback_url = "/api/video-detail/final.mp4",
        };
        const nlohmann::json bare = without_metadata;
        assert(bare.at("success") == true);
        assert(bare.at("metadata").is_object());
        assert(bare.at("metadata").empty());
        assert(bare.at("playbackUrl") == "/api/video-detail/final.mp4");

        UploadCompleteResponse with_metadata = without_metadata;
        with_metadata.metadata = MediaInfo{
            .duration = 12.5,
            .width = 1280,
            .height = 720,
            .bitrate = 2000000,
            .codec = "h264",
            .frame_rate = 25.0,
        };
        const nlohmann::json rich = with_metadata;
        assert(rich.at("metadata").at("width") == 1280);
        assert(rich.at("metadata").at("fps") == 25.0);
        assert(rich.at("metadata").at("codec") == "h264");
        assert(rich.at("metadata").at("bitrate") == 2000000);
    }

    void test_media_file_serialization()
    {
        MediaFile file{
            .filename = "clip_h264.mp4",
            .url = "/api/video-detail/transcoded/clip_h264.mp4",
            .size = 4096,
            .modified = 1700000000,
            .kind = MediaKind::Transcoded,
        };
        const nlohmann::json json = file;
        assert(json.at("type") == "transcoded");
        assert(json.at("transcoded") == true);
        assert(json.at("size") == 4096);

        assert(json.at("url") == file.url);
        assert(json.at("modified") == 1700000000);
    }

    void test_transcode_request()
    {
        const auto defaults = nlohmann::json::object().get<TranscodeRequest>();
        assert(defaults.codec == Codec::H264);
        assert(defaults.quality == Quality::Medium);
        assert(defaults.prefer_hardware);

        const auto explicit_request =
            nlohmann::json{{"codec", "h265"}, {"quality", "high"}, {"hardware", false}}.get<TranscodeRequest>();
        assert(explicit_request.codec == Codec::H265);
        assert(explicit_request.quality == Quality::High);
        assert(!explicit_request.prefer_hardware);

        bool rejected = false;
        try
        {
            (void)nlohmann::json{{"codec", "av1"}}.get<TranscodeRequest>();
        }
        catch (const ServiceError &error)
        {
            rejected = error.code() == ErrorCode::InvalidArgument;
        }
        assert(rejected);

        const nlohmann::json accepted = TranscodeAccepted{
            .output_filename = "clip_h265.mp4",
            .codec = Codec::H265,
            .quality = Quality::Low,
        };
        assert(accepted.at("outputFilename") == "clip_h265.mp4");
        assert(accepted.at("codec") == "h265");
        assert(accepted.at("quality") == "low");
    }

    void test_hardware_support_serialization()
    {
        HardwareSupport support{
            .qsv = false,
            .nvenc = true,
            .amf = false,
            .platform = "Linux",
            .caveat = "drivers",
        };
        const nlohmann::json json = support;
        assert(json.at("nvenc") == true);
        assert(json.at("platform") == "Linux");
        assert(json.at("qsv") == false && json.at("amf") == false);
        assert(json.at("caveat") == "drivers");
    }

    void test_crypto()
    {
        const std::array<std::byte, 4> chunk = {
            std::byte{0xDE},
            std::byte{0xAD},
            std::byte{0xBE},
            std::byte{0xEF},
        };
        const auto chunk_hash = crypto::hash_bytes(chunk);
        assert(chunk_hash.size() == 64);
        assert(chunk_hash == crypto::hash_text(std::string("\xDE\xAD\xBE\xEF", 4)));

        assert(crypto::hash_text("clip.mp4") == crypto::hash_text("clip.mp4"));
        assert(crypto::hash_text("clip.mp4") != crypto::hash_text("clip.mkv"));

        const auto token = crypto::random_hex(16);
        assert(token.size() == 32);
        assert(token.find_first_not_of("0123456789abcdef") == std::string::npos);
        assert(token != crypto::random_hex(16));
    }

} // namespace

int main()
{
    try
    {
        test_error_codes();
        test_enum_labels();
        test_upload_init_request();
        test_upload_progress_serialization();
        test_upload_complete_payloads();
        test_media_file_serialization();
        test_transcode_request();
        test_hardware_support_serialization();
        test_crypto();
        run_server_component_tests();
        run_media_pipeline_tests();
        run_http_parsing_tests();
        run_session_route_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
