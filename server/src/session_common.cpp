#include "session_common.hpp"

#include "streamvault/protocol.hpp"

namespace streamvault::server::session_common
{

    nlohmann::json parse_json_body(const http::HttpRequest &request)
    {
        auto json = nlohmann::json::parse(request.body, nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            throw ServiceError(ErrorCode::InvalidPayload, "Request body must be a JSON object");
        }
        return json;
    }

    http::HttpResponse make_ok_response(const nlohmann::json &payload)
    {
        return http::HttpResponse::json(200, payload);
    }

    http::HttpResponse make_error_response(ErrorCode code, std::string_view message)
    {
        return http::HttpResponse::json(http_status(code), protocol::make_error_body(code, message));
    }

    http::HttpResponse make_method_not_allowed(std::string_view allowed)
    {
        auto response = http::HttpResponse::json(405, protocol::make_error_body(ErrorCode::InvalidArgument,
                                                                                "Method not allowed"));
        response.headers.emplace_back("Allow", std::string(allowed));
        return response;
    }

} // namespace streamvault::server::session_common
