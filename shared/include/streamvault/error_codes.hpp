/**
 * StreamVault - Error codes shared by the media pipeline and the HTTP layer.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace streamvault
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidArgument = 1,
        InvalidPayload = 2,
        SessionNotFound = 3,
        IncompleteUpload = 4,
        IOError = 5,
        UnsatisfiableRange = 6,
        ExternalToolFailure = 7,
        UnsupportedFormat = 8,
        NotFound = 9,
        Busy = 10,
        InternalError = 11
    };

    std::string_view to_string(ErrorCode code) noexcept;

    // HTTP status a client sees when an operation fails with `code`.
    int http_status(ErrorCode code) noexcept;

    class ServiceError : public std::runtime_error
    {
    public:
        ServiceError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace streamvault
