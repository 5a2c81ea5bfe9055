#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "streamvault/error_codes.hpp"
#include "streamvault/server/http.hpp"

namespace streamvault::server::session_common
{

    // Parses a JSON object body; throws ServiceError(InvalidPayload).
    nlohmann::json parse_json_body(const http::HttpRequest &request);

    http::HttpResponse make_ok_response(const nlohmann::json &payload);

    http::HttpResponse make_error_response(ErrorCode code, std::string_view message);

    http::HttpResponse make_method_not_allowed(std::string_view allowed);

} // namespace streamvault::server::session_common
