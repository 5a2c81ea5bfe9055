#include "streamvault/server/multipart.hpp"

#include "streamvault/error_codes.hpp"
#include "streamvault/server/http.hpp"

namespace streamvault::server::http
{

    namespace
    {

        std::string_view trim(std::string_view value)
        {
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t'))
            {
                value.remove_suffix(1);
            }
            return value;
        }

        std::string_view unquote(std::string_view value)
        {
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
            {
                value.remove_prefix(1);
                value.remove_suffix(1);
            }
            return value;
        }

        [[noreturn]] void malformed(const std::string &message)
        {
            throw ServiceError(ErrorCode::InvalidPayload, "Malformed multipart body: " + message);
        }

        // form-data; name="chunk"; filename="part.bin"
        void apply_disposition(std::string_view value, FormPart &part)
        {
            bool first = true;
            while (!value.empty())
            {
                const auto semicolon = value.find(';');
                const auto item = trim(value.substr(0, semicolon));
                value = semicolon == std::string_view::npos ? std::string_view{} : value.substr(semicolon + 1);

                if (first)
                {
                    first = false;
                    if (to_lower(item) != "form-data")
                    {
                        malformed("unexpected disposition " + std::string(item));
                    }
                    continue;
                }
                const auto equals = item.find('=');
                if (equals == std::string_view::npos)
                {
                    continue;
                }
                const auto key = to_lower(trim(item.substr(0, equals)));
                const auto parameter = unquote(trim(item.substr(equals + 1)));
                if (key == "name")
                {
                    part.name = std::string(parameter);
                }
                else if (key == "filename")
                {
                    part.filename = std::string(parameter);
                }
            }
        }

        void parse_part_headers(std::string_view block, FormPart &part)
        {
            bool has_disposition = false;
            while (!block.empty())
            {
                const auto eol = block.find("\r\n");
                const auto line = block.substr(0, eol);
                block = eol == std::string_view::npos ? std::string_view{} : block.substr(eol + 2);
                if (line.empty())
                {
                    continue;
                }
                const auto colon = line.find(':');
                if (colon == std::string_view::npos)
                {
                    malformed("invalid part header");
                }
                const auto name = to_lower(trim(line.substr(0, colon)));
                const auto value = trim(line.substr(colon + 1));
                if (name == "content-disposition")
                {
                    apply_disposition(value, part);
                    has_disposition = true;
                }
                else if (name == "content-type")
                {
                    part.content_type = std::string(value);
                }
            }
            if (!has_disposition || part.name.empty())
            {
                malformed("part without a field name");
            }
        }

    } // namespace

    std::optional<std::string> multipart_boundary(std::string_view content_type)
    {
        const auto lowered = to_lower(content_type);
        if (lowered.rfind("multipart/form-data", 0) != 0)
        {
            return std::nullopt;
        }
        const auto marker = lowered.find("boundary=");
        if (marker == std::string::npos)
        {
            return std::nullopt;
        }
        auto value = content_type.substr(marker + 9);
        if (value.empty())
        {
            return std::nullopt;
        }
        const auto end = value.front() == '"' ? value.find('"', 1) + 1 : value.find_first_of("; \t");
        value = unquote(trim(value.substr(0, end)));
        if (value.empty())
        {
            return std::nullopt;
        }
        return std::string(value);
    }

    std::vector<FormPart> parse_multipart(std::string_view body, std::string_view boundary)
    {
        if (boundary.empty())
        {
            malformed("empty boundary");
        }
        const std::string delimiter = "--" + std::string(boundary);
        const std::string separator = "\r\n" + delimiter;

        auto position = body.find(delimiter);
        if (position == std::string_view::npos)
        {
            malformed("boundary not found");
        }

        std::vector<FormPart> parts;
        while (true)
        {
            position += delimiter.size();
            if (body.substr(position, 2) == "--")
            {
                break;
            }
            if (body.substr(position, 2) != "\r\n")
            {
                malformed("missing line break after boundary");
            }
            position += 2;

            const auto headers_end = body.find("\r\n\r\n", position);
            if (headers_end == std::string_view::npos)
            {
                malformed("unterminated part headers");
            }
            FormPart part;
            parse_part_headers(body.substr(position, headers_end - position), part);

            const auto data_start = headers_end + 4;
            const auto next = body.find(separator, data_start);
            if (next == std::string_view::npos)
            {
                malformed("unterminated part " + part.name);
            }
            part.data = body.substr(data_start, next - data_start);
            parts.push_back(std::move(part));
            position = next + 2;
        }
        return parts;
    }

    const FormPart *find_part(const std::vector<FormPart> &parts, std::string_view name)
    {
        for (const auto &part : parts)
        {
            if (part.name == name)
            {
                return &part;
            }
        }
        return nullptr;
    }

} // namespace streamvault::server::http
