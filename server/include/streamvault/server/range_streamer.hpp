#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace streamvault::server
{

    inline constexpr std::size_t kStreamBlockSize = 8 * 1024;

    struct ByteRange
    {
        std::uint64_t start{};
        std::uint64_t end{};

        std::uint64_t length() const noexcept { return end - start + 1; }
    };

    enum class RangeKind
    {
        Full,
        Partial,
        Unsatisfiable
    };

    struct RangeSelection
    {
        RangeKind kind{RangeKind::Full};
        ByteRange range{};
    };

    // Interprets a `Range` header against a file of `file_size` bytes.
    // Absent or malformed headers select the whole file; a well-formed start at
    // or past the end of the file is unsatisfiable; the end is clamped to the
    // file.
    RangeSelection select_range(std::optional<std::string_view> header, std::uint64_t file_size);

    struct StreamPlan
    {
        int status{200};
        std::filesystem::path path;
        std::uint64_t file_size{};
        std::uint64_t offset{};
        std::uint64_t length{};
        std::vector<std::pair<std::string, std::string>> headers;
    };

    // Status line data and headers for serving `path`; throws
    // ServiceError(NotFound) if the file cannot be stat'ed.
    StreamPlan plan_stream(const std::filesystem::path &path, std::optional<std::string_view> range_header);

    // Reads a byte window of a file in bounded blocks. The file handle lives as
    // long as the reader.
    class BlockReader
    {
    public:
        BlockReader(const std::filesystem::path &path, std::uint64_t offset, std::uint64_t length);

        // Fills at most buffer.size() bytes; 0 once the window is exhausted or
        // the file ends early.
        std::size_t read_next(std::span<char> buffer);

        std::uint64_t remaining() const noexcept { return remaining_; }

    private:
        std::ifstream file_;
        std::uint64_t remaining_;
    };

} // namespace streamvault::server
