#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace streamvault::server
{

    struct ProcessResult
    {
        int exit_code{-1};
        std::string output;

        bool succeeded() const noexcept { return exit_code == 0; }
    };

    enum class OutputCapture
    {
        StdoutOnly,
        StdoutAndStderr
    };

    // Seam over external tool execution (ffmpeg, ffprobe) so the media
    // pipeline can be exercised without the real binaries.
    class ProcessRunner
    {
    public:
        virtual ~ProcessRunner() = default;

        // Runs argv[0] with the remaining arguments and waits for it to exit.
        // Throws ServiceError(ExternalToolFailure) if the process cannot be
        // started at all.
        virtual ProcessResult run(const std::vector<std::string> &argv, OutputCapture capture) = 0;
    };

    class ShellProcessRunner final : public ProcessRunner
    {
    public:
        explicit ShellProcessRunner(std::size_t max_output_bytes = 1024 * 1024);

        ProcessResult run(const std::vector<std::string> &argv, OutputCapture capture) override;

    private:
        std::size_t max_output_bytes_;
    };

    std::string shell_quote(std::string_view argument);

} // namespace streamvault::server
