#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "streamvault/error_codes.hpp"
#include "streamvault/server/hardware_detector.hpp"
#include "streamvault/server/media_probe.hpp"
#include "streamvault/server/media_store.hpp"
#include "streamvault/server/process_runner.hpp"
#include "streamvault/server/range_streamer.hpp"
#include "streamvault/server/transcode_queue.hpp"
#include "streamvault/server/transcoder.hpp"

using namespace streamvault;
using namespace streamvault::server;

namespace
{

    // Stands in for ffmpeg/ffprobe. Every call is recorded; the behaviour
    // callback decides the outcome.
    class FakeRunner final : public ProcessRunner
    {
    public:
        using Behaviour = std::function<ProcessResult(const std::vector<std::string> &)>;

        explicit FakeRunner(Behaviour behaviour) : behaviour_(std::move(behaviour)) {}

        ProcessResult run(const std::vector<std::string> &argv, OutputCapture /*capture*/) override
        {
            {
                std::lock_guard lock(mutex_);
                calls_.push_back(argv);
            }
            return behaviour_(argv);
        }

        std::vector<std::vector<std::string>> calls() const
        {
            std::lock_guard lock(mutex_);
            return calls_;
        }

    private:
        Behaviour behaviour_;
        mutable std::mutex mutex_;
        std::vector<std::vector<std::string>> calls_;
    };

    class FakeProbe final : public MediaProbe
    {
    public:
        std::optional<protocol::MediaInfo> probe(const std::filesystem::path & /*path*/) override
        {
            return result;
        }

        std::optional<protocol::MediaInfo> result = protocol::MediaInfo{.duration = 1.0, .codec = "h264"};
    };

    class FakeCapabilities final : public CapabilityProbe
    {
    public:
        protocol::HardwareSupport detect() override
        {
            ++calls;
            return support;
        }

        protocol::HardwareSupport support{};
        std::atomic<int> calls{0};
    };

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    void write_file(const std::filesystem::path &path, std::string_view content)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::size_t count_entries(const std::filesystem::path &directory)
    {
        return static_cast<std::size_t>(std::distance(std::filesystem::directory_iterator(directory),
                                                      std::filesystem::directory_iterator{}));
    }

    bool contains(const std::vector<std::string> &argv, std::string_view value)
    {
        return std::find(argv.begin(), argv.end(), value) != argv.end();
    }

    ProcessResult encode_into_last_argument(const std::vector<std::string> &argv)
    {
        write_file(argv.back(), "encoded-video");
        return ProcessResult{.exit_code = 0, .output = ""};
    }

    std::optional<std::string> header_value(const StreamPlan &plan, std::string_view name)
    {
        for (const auto &[key, value] : plan.headers)
        {
            if (key == name)
            {
                return value;
            }
        }
        return std::nullopt;
    }

    void test_range_selection()
    {
        const auto full = select_range(std::nullopt, 1000);
        assert(full.kind == RangeKind::Full);
        assert(full.range.start == 0 && full.range.end == 999);

        const auto middle = select_range("bytes=100-199", 1000);
        assert(middle.kind == RangeKind::Partial);
        assert(middle.range.start == 100 && middle.range.end == 199);
        assert(middle.range.length() == 100);

        const auto clamped = select_range("bytes=900-2000", 1000);
        assert(clamped.kind == RangeKind::Partial);
        assert(clamped.range.start == 900 && clamped.range.end == 999);

        const auto open_ended = select_range("bytes=250-", 1000);
        assert(open_ended.kind == RangeKind::Partial);
        assert(open_ended.range.end == 999);

        assert(select_range("bytes=1000-", 1000).kind == RangeKind::Unsatisfiable);
        assert(select_range("bytes=5000-6000", 1000).kind == RangeKind::Unsatisfiable);
        assert(select_range("bytes=0-", 0).kind == RangeKind::Unsatisfiable);

        // An omitted start reads from the beginning of the file.
        const auto no_start = select_range("bytes=-500", 1000);
        assert(no_start.kind == RangeKind::Partial);
        assert(no_start.range.start == 0 && no_start.range.end == 500);

        const auto inverted = select_range("bytes=500-100", 1000);
        assert(inverted.kind == RangeKind::Partial);
        assert(inverted.range.start == 500 && inverted.range.end == 500);

        assert(select_range("bytes=abc-def", 1000).kind == RangeKind::Full);
        assert(select_range("items=0-10", 1000).kind == RangeKind::Full);
        assert(select_range("bytes=0-10,20-30", 1000).kind == RangeKind::Full);
        assert(select_range("bytes=-", 1000).kind == RangeKind::Full);
        assert(select_range("garbage", 1000).kind == RangeKind::Full);
        assert(select_range(" Bytes = 10-19 ", 1000).kind == RangeKind::Partial);
    }

    void test_stream_plans()
    {
        const auto root = std::filesystem::temp_directory_path() / "streamvault_stream_plan";
        cleanup_path(root);
        std::filesystem::create_directories(root);

        std::string content(1000, '\0');
        for (std::size_t i = 0; i < content.size(); ++i)
        {
            content[i] = static_cast<char>(i % 251);
        }
        const auto path = root / "clip.webm";
        write_file(path, content);

        const auto partial = plan_stream(path, "bytes=100-199");
        assert(partial.status == 206);
        assert(partial.offset == 100 && partial.length == 100);
        assert(partial.file_size == 1000);
        assert(header_value(partial, "Content-Range") == "bytes 100-199/1000");
        assert(header_value(partial, "Content-Type") == "video/webm");
        assert(header_value(partial, "Accept-Ranges") == "bytes");
        assert(header_value(partial, "Cache-Control") == "no-cache");
        assert(header_value(partial, "Pragma") == "no-cache");

        const auto whole = plan_stream(path, std::nullopt);
        assert(whole.status == 200);
        assert(whole.offset == 0 && whole.length == 1000);
        assert(!header_value(whole, "Content-Range"));
        assert(header_value(whole, "Accept-Ranges") == "bytes");

        const auto unsatisfiable = plan_stream(path, "bytes=1000-");
        assert(unsatisfiable.status == 416);
        assert(unsatisfiable.length == 0);
        assert(header_value(unsatisfiable, "Content-Range") == "bytes */1000");

        bool missing = false;
        try
        {
            (void)plan_stream(root / "absent.mp4", std::nullopt);
        }
        catch (const ServiceError &error)
        {
            missing = error.code() == ErrorCode::NotFound;
        }
        assert(missing);

        BlockReader reader(path, partial.offset, partial.length);
        std::vector<char> buffer(64);
        std::string streamed;
        std::size_t reads = 0;
        while (const auto count = reader.read_next(buffer))
        {
            assert(count <= buffer.size());
            streamed.append(buffer.data(), count);
            ++reads;
        }
        assert(reads == 2);
        assert(reader.remaining() == 0);
        assert(streamed == content.substr(100, 100));

        // A window past the real end stops early and reports what is missing.
        BlockReader short_reader(path, 990, 20);
        std::vector<char> block(kStreamBlockSize);
        assert(short_reader.read_next(block) == 10);
        assert(short_reader.read_next(block) == 0);
        assert(short_reader.remaining() == 10);

        cleanup_path(root);
    }

    void test_shell_runner()
    {
        assert(shell_quote("plain") == "'plain'");
        assert(shell_quote("it's; rm -rf /") == "'it'\\''s; rm -rf /'");

        ShellProcessRunner runner;
        const auto result = runner.run({"sh", "-c", "printf '%s' \"$0\"; exit 3", "a b'c"}, OutputCapture::StdoutOnly);
        assert(result.exit_code == 3);
        assert(!result.succeeded());
        assert(result.output == "a b'c");

        const std::vector<std::string> to_stderr{"sh", "-c", "echo oops >&2"};
        assert(runner.run(to_stderr, OutputCapture::StdoutAndStderr).output == "oops\n");
        const auto quiet = runner.run(to_stderr, OutputCapture::StdoutOnly);
        assert(quiet.succeeded() && quiet.output.empty());

        bool rejected = false;
        try
        {
            (void)runner.run({}, OutputCapture::StdoutOnly);
        }
        catch (const ServiceError &error)
        {
            rejected = error.code() == ErrorCode::ExternalToolFailure;
        }
        assert(rejected);
    }

    void test_ffprobe_parsing()
    {
        constexpr std::string_view kProbeOutput = R"({
            "streams": [
                {"index": 0, "codec_type": "audio", "codec_name": "aac", "bit_rate": "128000"},
                {"index": 1, "codec_type": "video", "codec_name": "h264", "width": 1920, "height": 1080,
                 "r_frame_rate": "30000/1001", "bit_rate": "4000000"}
            ],
            "format": {"duration": "12.500000", "bit_rate": "4200000"}
        })";

        const auto info = parse_ffprobe_output(kProbeOutput);
        assert(info);
        assert(info->codec == "h264");
        assert(info->width == 1920 && info->height == 1080);
        assert(info->bitrate == 4000000);
        assert(std::abs(info->duration - 12.5) < 1e-9);
        assert(std::abs(info->frame_rate - 29.97) < 0.01);

        const auto audio_only = parse_ffprobe_output(R"({"streams": [{"codec_type": "audio"}], "format": {}})");
        assert(!audio_only);
        assert(!parse_ffprobe_output("not json"));
        assert(!parse_ffprobe_output("[]"));

        const auto garbled = parse_ffprobe_output(R"({
            "streams": [{"codec_type": "video", "width": "nan", "height": "1e300", "bit_rate": "inf",
                         "duration": "nan"}],
            "format": {"duration": "-inf", "bit_rate": "-1e30"}
        })");
        assert(garbled);
        assert(garbled->width == 0 && garbled->height == 0);
        assert(garbled->bitrate == 0);
        assert(garbled->duration == 0.0);

        assert(parse_frame_rate("25/1") == 25.0);
        assert(parse_frame_rate("30") == 30.0);
        assert(parse_frame_rate("0/0") == 0.0);
        assert(parse_frame_rate("abc") == 0.0);

        FakeRunner runner([&](const std::vector<std::string> &)
                          { return ProcessResult{.exit_code = 0, .output = std::string(kProbeOutput)}; });
        FfprobeMediaProbe probe(runner, "/opt/ffprobe");
        const auto probed = probe.probe("/media/clip.mp4");
        assert(probed && probed->width == 1920);
        const auto calls = runner.calls();
        assert(calls.size() == 1);
        assert(calls[0].front() == "/opt/ffprobe");
        assert(calls[0].back() == "/media/clip.mp4");
        assert(contains(calls[0], "-show_streams"));

        FakeRunner failing([](const std::vector<std::string> &)
                           { return ProcessResult{.exit_code = 1, .output = ""}; });
        FfprobeMediaProbe failing_probe(failing, "ffprobe");
        assert(!failing_probe.probe("/media/clip.mp4"));

        FakeRunner throwing([](const std::vector<std::string> &) -> ProcessResult
                            { throw ServiceError(ErrorCode::ExternalToolFailure, "Failed to start ffprobe"); });
        FfprobeMediaProbe throwing_probe(throwing, "ffprobe");
        assert(!throwing_probe.probe("/media/clip.mp4"));
    }

    void test_hardware_detection()
    {
        const auto listing = parse_codec_listing(" V....D H264_NVENC  NVIDIA NVENC H.264 encoder\n"
                                                 " V....D libx264      libx264 H.264 / AVC\n");
        assert(!listing.qsv && listing.nvenc && !listing.amf);

        FakeRunner runner([](const std::vector<std::string> &)
                          { return ProcessResult{.exit_code = 0, .output = "h264_qsv h264_amf"}; });
        FfmpegCapabilityProbe probe(runner, "ffmpeg");
        const auto detected = probe.detect();
        assert(detected.qsv && !detected.nvenc && detected.amf);
        assert(detected.platform == current_platform());
        assert(detected.caveat == platform_caveat(current_platform()));
        assert(contains(runner.calls().front(), "-codecs"));

        FakeRunner failing([](const std::vector<std::string> &)
                           { return ProcessResult{.exit_code = 1, .output = "h264_qsv"}; });
        FfmpegCapabilityProbe failing_probe(failing, "ffmpeg");
        const auto failed = failing_probe.detect();
        assert(!failed.qsv && !failed.nvenc && !failed.amf);
        assert(failed.caveat.find("status 1") != std::string::npos);

        FakeRunner throwing([](const std::vector<std::string> &) -> ProcessResult
                            { throw ServiceError(ErrorCode::ExternalToolFailure, "Failed to start ffmpeg"); });
        FfmpegCapabilityProbe throwing_probe(throwing, "ffmpeg");
        const auto unavailable = throwing_probe.detect();
        assert(!unavailable.qsv && !unavailable.nvenc && !unavailable.amf);
        assert(unavailable.caveat == "Failed to start ffmpeg");
    }

    void test_encoder_selection()
    {
        protocol::HardwareSupport all{.qsv = true, .nvenc = true, .amf = true};
        assert(hardware_encoder(protocol::Codec::H264, all) == "h264_qsv");
        assert(hardware_encoder(protocol::Codec::H265, all) == "hevc_qsv");

        protocol::HardwareSupport nvidia_amd{.qsv = false, .nvenc = true, .amf = true};
        assert(hardware_encoder(protocol::Codec::H264, nvidia_amd) == "h264_nvenc");

        protocol::HardwareSupport amd{.qsv = false, .nvenc = false, .amf = true};
        assert(hardware_encoder(protocol::Codec::H265, amd) == "hevc_amf");

        assert(!hardware_encoder(protocol::Codec::H264, protocol::HardwareSupport{}));

        assert(software_encoder(protocol::Codec::H264) == "libx264");
        assert(software_encoder(protocol::Codec::H265) == "libx265");
        assert(crf_for(protocol::Quality::Low) == 18);
        assert(crf_for(protocol::Quality::Medium) == 23);
        assert(crf_for(protocol::Quality::High) == 28);
        assert(crf_for(protocol::Quality::Low) < crf_for(protocol::Quality::High));

        assert(derivative_filename("/videos/movie.mov", protocol::Codec::H265) == "movie_h265.mp4");
        assert(derivative_filename("clip.final.mkv", protocol::Codec::H264) == "clip.final_h264.mp4");

        assert(kHardwarePresets[0].encoder == "h264_qsv" && kHardwarePresets[0].crf == 23);
        assert(kHardwarePresets[1].encoder == "hevc_qsv" && kHardwarePresets[1].crf == 28);
    }

    struct TranscodeFixture
    {
        explicit TranscodeFixture(const std::string &name)
            : root(std::filesystem::temp_directory_path() / name)
        {
            cleanup_path(root);
            std::filesystem::create_directories(root / "videos");
            input = root / "videos" / "source.mov";
            write_file(input, "source-video");
            output = root / "transcoded" / "source_h264.mp4";
        }

        ~TranscodeFixture()
        {
            cleanup_path(root);
        }

        TranscodeJob job(protocol::Quality quality = protocol::Quality::Medium, bool prefer_hardware = true) const
        {
            return TranscodeJob{
                .input = input,
                .output = output,
                .codec = protocol::Codec::H264,
                .quality = quality,
                .prefer_hardware = prefer_hardware,
            };
        }

        std::filesystem::path root;
        std::filesystem::path input;
        std::filesystem::path output;
        FakeProbe probe;
        FakeCapabilities capabilities;
    };

    void test_transcoder_falls_back_to_software()
    {
        TranscodeFixture fixture("streamvault_transcode_fallback");
        fixture.capabilities.support.qsv = true;

        FakeRunner runner([](const std::vector<std::string> &argv)
                          {
                              if (contains(argv, "h264_qsv"))
                              {
                                  return ProcessResult{.exit_code = 1, .output = "Error initializing QSV"};
                              }
                              return encode_into_last_argument(argv); });
        Transcoder transcoder(runner, fixture.probe, fixture.capabilities, "ffmpeg");

        assert(transcoder.transcode(fixture.job(protocol::Quality::High)));
        assert(read_file(fixture.output) == "encoded-video");
        assert(count_entries(fixture.output.parent_path()) == 1);

        const auto calls = runner.calls();
        assert(calls.size() == 2);
        assert(contains(calls[0], "h264_qsv"));
        assert(contains(calls[1], "libx264"));
        assert(contains(calls[1], "-crf"));
        assert(contains(calls[1], "28"));
        assert(contains(calls[1], "+faststart"));
        assert(calls[1].back() != fixture.output.string());
        assert(std::filesystem::path(calls[1].back()).filename().string().front() == '.');
    }

    void test_transcoder_hardware_success()
    {
        TranscodeFixture fixture("streamvault_transcode_hardware");
        fixture.capabilities.support.nvenc = true;

        FakeRunner runner(encode_into_last_argument);
        Transcoder transcoder(runner, fixture.probe, fixture.capabilities, "ffmpeg");

        assert(transcoder.transcode(fixture.job()));
        const auto calls = runner.calls();
        assert(calls.size() == 1);
        assert(contains(calls[0], "h264_nvenc"));
        assert(contains(calls[0], "fast"));
        assert(std::filesystem::exists(fixture.output));
    }

    void test_transcoder_empty_hardware_output_falls_back()
    {
        TranscodeFixture fixture("streamvault_transcode_empty");
        fixture.capabilities.support.amf = true;

        FakeRunner runner([](const std::vector<std::string> &argv)
                          {
                              if (contains(argv, "h264_amf"))
                              {
                                  write_file(argv.back(), "");
                                  return ProcessResult{.exit_code = 0, .output = ""};
                              }
                              return encode_into_last_argument(argv); });
        Transcoder transcoder(runner, fixture.probe, fixture.capabilities, "ffmpeg");

        assert(transcoder.transcode(fixture.job()));
        assert(runner.calls().size() == 2);
        assert(read_file(fixture.output) == "encoded-video");
        assert(count_entries(fixture.output.parent_path()) == 1);
    }

    void test_transcoder_total_failure_leaves_nothing()
    {
        TranscodeFixture fixture("streamvault_transcode_failure");
        fixture.capabilities.support.qsv = true;

        FakeRunner runner([](const std::vector<std::string> &argv)
                          {
                              write_file(argv.back(), "half-written");
                              return ProcessResult{.exit_code = 1, .output = "Conversion failed!"}; });
        Transcoder transcoder(runner, fixture.probe, fixture.capabilities, "ffmpeg");

        assert(!transcoder.transcode(fixture.job()));
        assert(runner.calls().size() == 2);
        assert(!std::filesystem::exists(fixture.output));
        assert(count_entries(fixture.output.parent_path()) == 0);
    }

    void test_transcoder_software_only_and_bad_input()
    {
        TranscodeFixture fixture("streamvault_transcode_software");
        fixture.capabilities.support.qsv = true;

        FakeRunner runner(encode_into_last_argument);
        Transcoder transcoder(runner, fixture.probe, fixture.capabilities, "ffmpeg");

        assert(transcoder.transcode(fixture.job(protocol::Quality::Low, false)));
        assert(fixture.capabilities.calls == 0);
        assert(runner.calls().size() == 1);
        assert(contains(runner.calls()[0], "18"));

        fixture.probe.result = std::nullopt;
        std::filesystem::remove(fixture.output);
        assert(!transcoder.transcode(fixture.job()));
        assert(runner.calls().size() == 1);

        auto missing = fixture.job();
        missing.input = fixture.root / "videos" / "absent.mp4";
        assert(!transcoder.transcode(missing));
        assert(runner.calls().size() == 1);
    }

    void test_transcode_queue_runs_jobs()
    {
        TranscodeFixture fixture("streamvault_transcode_queue");
        FakeRunner runner(encode_into_last_argument);
        Transcoder transcoder(runner, fixture.probe, fixture.capabilities, "ffmpeg");
        TranscodeQueue queue(transcoder, 2, 8);

        for (int i = 0; i < 3; ++i)
        {
            auto job = fixture.job();
            job.output = fixture.root / "transcoded" / ("out_" + std::to_string(i) + ".mp4");
            assert(queue.submit(std::move(job)));
        }
        queue.shutdown();
        assert(queue.pending() == 0);
        for (int i = 0; i < 3; ++i)
        {
            assert(std::filesystem::exists(fixture.root / "transcoded" / ("out_" + std::to_string(i) + ".mp4")));
        }
        assert(!queue.submit(fixture.job()));
    }

    void test_transcode_queue_is_bounded()
    {
        TranscodeFixture fixture("streamvault_transcode_bounded");

        std::mutex gate_mutex;
        std::condition_variable gate_cv;
        bool released = false;
        FakeRunner runner([&](const std::vector<std::string> &argv)
                          {
                              std::unique_lock lock(gate_mutex);
                              gate_cv.wait(lock, [&]
                                           { return released; });
                              return encode_into_last_argument(argv); });
        Transcoder transcoder(runner, fixture.probe, fixture.capabilities, "ffmpeg");
        TranscodeQueue queue(transcoder, 1, 2);

        auto first = fixture.job();
        first.output = fixture.root / "transcoded" / "first.mp4";
        auto second = fixture.job();
        second.output = fixture.root / "transcoded" / "second.mp4";
        auto third = fixture.job();
        third.output = fixture.root / "transcoded" / "third.mp4";

        assert(queue.submit(first));
        assert(queue.submit(second));
        assert(!queue.submit(third));
        assert(queue.pending() == 2);

        {
            std::lock_guard lock(gate_mutex);
            released = true;
        }
        gate_cv.notify_all();
        queue.shutdown();

        assert(std::filesystem::exists(first.output));
        assert(std::filesystem::exists(second.output));
        assert(!std::filesystem::exists(third.output));
        assert(queue.pending() == 0);
    }

} // namespace

void run_media_pipeline_tests()
{
    test_range_selection();
    test_stream_plans();
    test_shell_runner();
    test_ffprobe_parsing();
    test_hardware_detection();
    test_encoder_selection();
    test_transcoder_falls_back_to_software();
    test_transcoder_hardware_success();
    test_transcoder_empty_hardware_output_falls_back();
    test_transcoder_total_failure_leaves_nothing();
    test_transcoder_software_only_and_bad_input();
    test_transcode_queue_runs_jobs();
    test_transcode_queue_is_bounded();
}
