#include "streamvault/server/process_runner.hpp"

#include <array>
#include <cstdio>
#include <memory>

#include <sys/wait.h>

#include <spdlog/spdlog.h>

#include "streamvault/error_codes.hpp"

namespace streamvault::server
{

    namespace
    {
        struct PipeCloser
        {
            void operator()(FILE *pipe) const noexcept
            {
                if (pipe)
                {
                    pclose(pipe);
                }
            }
        };

        using PipeHandle = std::unique_ptr<FILE, PipeCloser>;

        int decode_wait_status(int status)
        {
            if (status == -1)
            {
                return -1;
            }
            if (WIFEXITED(status))
            {
                return WEXITSTATUS(status);
            }
            return -1;
        }
    } // namespace

    std::string shell_quote(std::string_view argument)
    {
        std::string quoted;
        quoted.reserve(argument.size() + 2);
        quoted.push_back('\'');
        for (const char ch : argument)
        {
            if (ch == '\'')
            {
                quoted += "'\\''";
            }
            else
            {
                quoted.push_back(ch);
            }
        }
        quoted.push_back('\'');
        return quoted;
    }

    ShellProcessRunner::ShellProcessRunner(std::size_t max_output_bytes) : max_output_bytes_(max_output_bytes) {}

    ProcessResult ShellProcessRunner::run(const std::vector<std::string> &argv, OutputCapture capture)
    {
        if (argv.empty())
        {
            throw ServiceError(ErrorCode::ExternalToolFailure, "Empty command line");
        }

        std::string command;
        for (const auto &argument : argv)
        {
            if (!command.empty())
            {
                command.push_back(' ');
            }
            command += shell_quote(argument);
        }
        command += capture == OutputCapture::StdoutAndStderr ? " 2>&1" : " 2>/dev/null";
        command += " </dev/null";

        spdlog::debug("Running {}", command);
        PipeHandle pipe(popen(command.c_str(), "r"));
        if (!pipe)
        {
            throw ServiceError(ErrorCode::ExternalToolFailure, "Failed to start " + argv.front());
        }

        ProcessResult result;
        std::array<char, 4096> buffer{};
        while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr)
        {
            if (result.output.size() < max_output_bytes_)
            {
                result.output += buffer.data();
            }
        }
        result.exit_code = decode_wait_status(pclose(pipe.release()));
        return result;
    }

} // namespace streamvault::server
