#include "streamvault/server/range_streamer.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

#include "streamvault/error_codes.hpp"
#include "streamvault/server/media_store.hpp"

namespace streamvault::server
{

    namespace
    {

        std::string_view trim(std::string_view value)
        {
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
            {
                value.remove_suffix(1);
            }
            return value;
        }

        bool iequals(std::string_view a, std::string_view b)
        {
            return a.size() == b.size() &&
                   std::equal(a.begin(), a.end(), b.begin(), [](char x, char y)
                              { return std::tolower(static_cast<unsigned char>(x)) ==
                                       std::tolower(static_cast<unsigned char>(y)); });
        }

        std::optional<std::uint64_t> parse_offset(std::string_view text)
        {
            if (text.empty())
            {
                return std::nullopt;
            }
            std::uint64_t value = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size())
            {
                return std::nullopt;
            }
            return value;
        }

        struct ParsedRange
        {
            std::optional<std::uint64_t> start;
            std::optional<std::uint64_t> end;
        };

        // "bytes=<start>-<end>" with either bound optional but not both.
        std::optional<ParsedRange> parse_range_header(std::string_view header)
        {
            header = trim(header);
            const auto equals = header.find('=');
            if (equals == std::string_view::npos || !iequals(trim(header.substr(0, equals)), "bytes"))
            {
                return std::nullopt;
            }
            const auto ranges = trim(header.substr(equals + 1));
            if (ranges.find(',') != std::string_view::npos)
            {
                return std::nullopt;
            }
            const auto dash = ranges.find('-');
            if (dash == std::string_view::npos || ranges.find('-', dash + 1) != std::string_view::npos)
            {
                return std::nullopt;
            }

            const auto start_text = trim(ranges.substr(0, dash));
            const auto end_text = trim(ranges.substr(dash + 1));
            if (start_text.empty() && end_text.empty())
            {
                return std::nullopt;
            }

            ParsedRange parsed;
            if (!start_text.empty())
            {
                parsed.start = parse_offset(start_text);
                if (!parsed.start)
                {
                    return std::nullopt;
                }
            }
            if (!end_text.empty())
            {
                parsed.end = parse_offset(end_text);
                if (!parsed.end)
                {
                    return std::nullopt;
                }
            }
            return parsed;
        }

    } // namespace

    RangeSelection select_range(std::optional<std::string_view> header, std::uint64_t file_size)
    {
        const ByteRange whole{0, file_size == 0 ? 0 : file_size - 1};
        if (!header)
        {
            return {RangeKind::Full, whole};
        }
        const auto parsed = parse_range_header(*header);
        if (!parsed)
        {
            return {RangeKind::Full, whole};
        }

        // An omitted start means "from the beginning".
        const std::uint64_t start = parsed->start.value_or(0);
        if (start >= file_size)
        {
            return {RangeKind::Unsatisfiable, ByteRange{start, start}};
        }
        std::uint64_t end = std::min(parsed->end.value_or(file_size - 1), file_size - 1);
        end = std::max(end, start);
        return {RangeKind::Partial, ByteRange{start, end}};
    }

    StreamPlan plan_stream(const std::filesystem::path &path, std::optional<std::string_view> range_header)
    {
        std::error_code ec;
        const auto file_size = std::filesystem::file_size(path, ec);
        if (ec)
        {
            throw ServiceError(ErrorCode::NotFound, "Video file does not exist");
        }

        StreamPlan plan;
        plan.path = path;
        plan.file_size = file_size;
        plan.headers = {
            {"Accept-Ranges", "bytes"},
            {"Cache-Control", "no-cache"},
            {"Pragma", "no-cache"},
        };

        const auto selection = select_range(range_header, file_size);
        switch (selection.kind)
        {
        case RangeKind::Full:
            plan.status = 200;
            plan.offset = 0;
            plan.length = file_size;
            plan.headers.emplace_back("Content-Type", mime_type_for(path));
            break;
        case RangeKind::Partial:
            plan.status = 206;
            plan.offset = selection.range.start;
            plan.length = selection.range.length();
            plan.headers.emplace_back("Content-Type", mime_type_for(path));
            plan.headers.emplace_back("Content-Range", "bytes " + std::to_string(selection.range.start) + "-" +
                                                           std::to_string(selection.range.end) + "/" +
                                                           std::to_string(file_size));
            break;
        case RangeKind::Unsatisfiable:
            plan.status = 416;
            plan.offset = 0;
            plan.length = 0;
            plan.headers.emplace_back("Content-Range", "bytes */" + std::to_string(file_size));
            break;
        }
        return plan;
    }

    BlockReader::BlockReader(const std::filesystem::path &path, std::uint64_t offset, std::uint64_t length)
        : file_(path, std::ios::binary), remaining_(length)
    {
        if (!file_.is_open())
        {
            throw ServiceError(ErrorCode::IOError, "Failed to open " + path.filename().string());
        }
        file_.seekg(static_cast<std::streamoff>(offset));
        if (!file_)
        {
            throw ServiceError(ErrorCode::IOError, "Failed to seek in " + path.filename().string());
        }
    }

    std::size_t BlockReader::read_next(std::span<char> buffer)
    {
        if (remaining_ == 0 || buffer.empty())
        {
            return 0;
        }
        const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), remaining_));
        file_.read(buffer.data(), static_cast<std::streamsize>(wanted));
        const auto count = static_cast<std::size_t>(std::max<std::streamsize>(file_.gcount(), 0));
        remaining_ -= count;
        return count;
    }

} // namespace streamvault::server
