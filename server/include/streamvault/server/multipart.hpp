#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace streamvault::server::http
{

    // One multipart/form-data field. `data` points into the parsed body, which
    // must outlive the part.
    struct FormPart
    {
        std::string name;
        std::optional<std::string> filename;
        std::string content_type;
        std::string_view data;
    };

    std::optional<std::string> multipart_boundary(std::string_view content_type);

    // Throws ServiceError(InvalidPayload) on malformed input.
    std::vector<FormPart> parse_multipart(std::string_view body, std::string_view boundary);

    const FormPart *find_part(const std::vector<FormPart> &parts, std::string_view name);

} // namespace streamvault::server::http
