#include "streamvault/server/session.hpp"

#include <charconv>
#include <cstddef>
#include <span>
#include <system_error>

#include <nlohmann/json.hpp>

#include "streamvault/server/multipart.hpp"
#include "session_common.hpp"

namespace streamvault::server
{

    namespace
    {

        std::vector<http::FormPart> parse_form(const http::HttpRequest &request)
        {
            const auto boundary = http::multipart_boundary(request.header("content-type").value_or(""));
            if (!boundary)
            {
                throw ServiceError(ErrorCode::InvalidPayload, "Expected a multipart/form-data body");
            }
            return http::parse_multipart(request.body, *boundary);
        }

        std::span<const std::byte> as_bytes(std::string_view data)
        {
            return std::as_bytes(std::span<const char>(data.data(), data.size()));
        }

        std::optional<std::uint64_t> parse_index(std::string_view text)
        {
            std::uint64_t value = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size())
            {
                return std::nullopt;
            }
            return value;
        }

    } // namespace

    http::HttpResponse Session::handle_upload_init(const http::HttpRequest &request)
    {
        const auto body = session_common::parse_json_body(request);
        const auto init = body.get<protocol::UploadInitRequest>();
        const auto session = services_.uploads.init_upload(init.filename, init.file_size, init.chunk_size);

        const protocol::UploadInitResponse response{
            .session_id = session.session_id,
            .total_chunks = session.total_chunks,
            .status = to_progress(session),
        };
        return session_common::make_ok_response(response);
    }

    http::HttpResponse Session::handle_upload_chunk(const http::HttpRequest &request)
    {
        const auto parts = parse_form(request);
        auto session_part = http::find_part(parts, "sessionId");
        if (!session_part)
        {
            session_part = http::find_part(parts, "fileId");
        }
        const auto *index_part = http::find_part(parts, "chunkIndex");
        const auto *chunk_part = http::find_part(parts, "chunk");
        if (!session_part || session_part->data.empty() || !index_part || !chunk_part)
        {
            throw ServiceError(ErrorCode::InvalidArgument, "sessionId, chunkIndex and chunk are required");
        }
        const auto index = parse_index(index_part->data);
        if (!index)
        {
            throw ServiceError(ErrorCode::InvalidArgument, "chunkIndex must be a non-negative integer");
        }

        const std::string session_id(session_part->data);
        const auto session = services_.uploads.upload_chunk(session_id, *index, as_bytes(chunk_part->data));

        const protocol::UploadChunkResponse response{
            .session_id = session.session_id,
            .chunk_index = *index,
            .received_chunks = session.received_chunks.size(),
            .total_chunks = session.total_chunks,
            .progress_percent = static_cast<double>(session.received_chunks.size()) * 100.0 /
                                static_cast<double>(session.total_chunks),
        };
        return session_common::make_ok_response(response);
    }

    http::HttpResponse Session::handle_upload_complete(const http::HttpRequest &request)
    {
        const auto body = session_common::parse_json_body(request);
        const auto complete = body.get<protocol::UploadCompleteRequest>();
        if (complete.session_id.empty())
        {
            throw ServiceError(ErrorCode::InvalidArgument, "sessionId is required");
        }

        const auto completed = services_.uploads.complete_upload(complete.session_id, complete.filename);
        const protocol::UploadCompleteResponse response{
            .filename = completed.filename,
            .metadata = completed.metadata,
            .playback_url = completed.playback_url,
        };
        return session_common::make_ok_response(response);
    }

    http::HttpResponse Session::handle_upload_status(const std::string &session_id)
    {
        const auto session = services_.uploads.status(session_id);
        if (!session)
        {
            throw ServiceError(ErrorCode::SessionNotFound, "Upload session does not exist");
        }
        return session_common::make_ok_response(to_progress(*session));
    }

    http::HttpResponse Session::handle_upload_video(const http::HttpRequest &request)
    {
        const auto parts = parse_form(request);
        const auto *file_part = http::find_part(parts, "file");
        if (!file_part)
        {
            throw ServiceError(ErrorCode::InvalidArgument, "No file uploaded");
        }
        const auto stored = services_.uploads.store_single_upload(file_part->filename.value_or(""),
                                                                  as_bytes(file_part->data));
        return session_common::make_ok_response({
            {"message", "Upload succeeded"},
            {"filename", stored},
        });
    }

} // namespace streamvault::server
