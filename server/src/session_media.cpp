#include "streamvault/server/session.hpp"

#include <nlohmann/json.hpp>

#include "streamvault/server/transcoder.hpp"
#include "session_common.hpp"

namespace streamvault::server
{

    namespace
    {

        nlohmann::json transcode_config_json()
        {
            nlohmann::json hardware = nlohmann::json::object();
            for (const auto &preset : kHardwarePresets)
            {
                hardware[std::string(protocol::to_string(preset.codec))] = {
                    {"codec", std::string(preset.encoder)},
                    {"preset", std::string(preset.preset)},
                    {"crf", preset.crf},
                };
            }

            nlohmann::json quality = nlohmann::json::object();
            for (const auto level : {protocol::Quality::Low, protocol::Quality::Medium, protocol::Quality::High})
            {
                quality[std::string(protocol::to_string(level))] = crf_for(level);
            }

            return {
                {"hardware", hardware},
                {"software", {
                                 {"preset", std::string(kEncodingPreset)},
                                 {"h264", std::string(software_encoder(protocol::Codec::H264))},
                                 {"h265", std::string(software_encoder(protocol::Codec::H265))},
                                 {"crf", quality},
                             }},
            };
        }

    } // namespace

    http::HttpResponse Session::handle_list_videos()
    {
        nlohmann::json payload = nlohmann::json::array();
        for (const auto &file : services_.catalog.list())
        {
            payload.push_back(file);
        }
        return session_common::make_ok_response(payload);
    }

    http::HttpResponse Session::handle_hardware_info()
    {
        const auto support = services_.capabilities.detect();
        return session_common::make_ok_response({
            {"hardwareSupport", support},
            {"transcodeConfig", transcode_config_json()},
        });
    }

    http::HttpResponse Session::handle_transcode(const http::HttpRequest &request, const std::string &filename)
    {
        const auto source = services_.media_store.resolve(protocol::MediaKind::Original, filename);
        const auto body = request.body.empty() ? nlohmann::json::object() : session_common::parse_json_body(request);
        const auto options = body.get<protocol::TranscodeRequest>();

        const auto output_name = derivative_filename(source, options.codec);
        TranscodeJob job{
            .input = source,
            .output = services_.media_store.transcoded_dir() / output_name,
            .codec = options.codec,
            .quality = options.quality,
            .prefer_hardware = options.prefer_hardware,
        };
        if (!services_.transcode_queue.submit(std::move(job)))
        {
            throw ServiceError(ErrorCode::Busy, "Transcode queue is full");
        }

        const protocol::TranscodeAccepted accepted{
            .output_filename = output_name,
            .codec = options.codec,
            .quality = options.quality,
        };
        return session_common::make_ok_response(accepted);
    }

    http::HttpResponse Session::handle_cleanup()
    {
        const auto removed = services_.uploads.cleanup_stale_chunks(services_.chunk_max_age);
        return session_common::make_ok_response({
            {"success", true},
            {"removed", removed},
            {"message", "Cleanup finished"},
        });
    }

} // namespace streamvault::server
