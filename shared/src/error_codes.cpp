#include "streamvault/error_codes.hpp"

#include <array>

namespace streamvault
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
            int status;
        };

        constexpr std::array<ErrorCodeDescription, 12> kDescriptions{{
            {ErrorCode::Ok, "ok", 200},
            {ErrorCode::InvalidArgument, "invalid_argument", 400},
            {ErrorCode::InvalidPayload, "invalid_payload", 400},
            {ErrorCode::SessionNotFound, "session_not_found", 404},
            {ErrorCode::IncompleteUpload, "incomplete_upload", 500},
            {ErrorCode::IOError, "io_error", 500},
            {ErrorCode::UnsatisfiableRange, "unsatisfiable_range", 416},
            {ErrorCode::ExternalToolFailure, "external_tool_failure", 500},
            {ErrorCode::UnsupportedFormat, "unsupported_format", 400},
            {ErrorCode::NotFound, "not_found", 404},
            {ErrorCode::Busy, "busy", 503},
            {ErrorCode::InternalError, "internal_error", 500},
        }};
    } // namespace

    ServiceError::ServiceError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    int http_status(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.status;
            }
        }
        return 500;
    }

} // namespace streamvault
