#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../../src/common/pre_checks.hpp"
#include "../../src/config/config.hpp"
#include "../../src/core/core.hpp"
#include "../../src/core/output.hpp"
#include "../../src/utils/system.hpp"

#include "../fixtures.hpp"

using ::testing::_;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::Return;

static Err InitFrom(std::vector<std::string> args) {
    args.insert(args.begin(), "ngxparse");
    std::vector<const char *> argv;
    for (const auto &arg : args) {
        argv.push_back(arg.c_str());
    }
    return config::InitFromArgs(static_cast<int>(argv.size()), argv.data());
}

// Same sequence as main(), returning the process exit status.
static int RunTool(const std::vector<std::string> &args) {
    Err err = InitFrom(args);
    if (err != Err::Ok) {
        return ExitCode(err);
    }
    err = core::Init();
    if (err != Err::Ok) {
        return ExitCode(err);
    }
    return ExitCode(core::Run());
}

static std::string SampleLog() {
    LineFields slow{};
    slow.request_time = "1.250";
    slow.request_id = "slow";
    slow.status = "504";

    LineFields fast{};
    fast.request_time = "0.001";
    fast.request_id = "fast";

    LineFields missing{};
    missing.request_time = "-";
    missing.request_id = "missing";
    missing.request = "POST /login HTTP/1.1";

    LineFields medium{};
    medium.request_time = "0.300";
    medium.request_id = "medium";
    medium.time_local = "26/Apr/2021:21:25:00 +0000";

    return MakeLine(slow) + "\n" + "garbage line\n" + "\n" +
           MakeLine(fast) + "\r\n" + MakeLine(missing) + "\n" +
           MakeLine(medium) + "\n";
}

TEST(PipelineTest, SortsLimitsAndWritesInOrder) {
    ASSERT_EQ(InitFrom({"-i", "-", "-o", "-", "--sort-by", "request_time",
                        "--desc", "--limit", "3"}),
              Err::Ok);

    MockWriter writer;
    {
        InSequence seq;
        EXPECT_CALL(writer, Begin()).WillOnce(Return(Err::Ok));
        EXPECT_CALL(writer, Write(Field(&core::AccessRecord::request_id, "slow")))
            .WillOnce(Return(Err::Ok));
        EXPECT_CALL(writer, Write(Field(&core::AccessRecord::request_id, "medium")))
            .WillOnce(Return(Err::Ok));
        EXPECT_CALL(writer, Write(Field(&core::AccessRecord::request_id, "fast")))
            .WillOnce(Return(Err::Ok));
        EXPECT_CALL(writer, Finish()).WillOnce(Return(Err::Ok));
    }

    std::istringstream in(SampleLog());
    core::RunSummary summary{};
    EXPECT_EQ(core::Process(in, writer, summary), Err::Ok);
    EXPECT_EQ(summary.written, 3u);
    EXPECT_EQ(summary.bad_lines, 1u);
}

TEST(PipelineTest, FiltersBeforeWriting) {
    ASSERT_EQ(InitFrom({"-i", "-", "-o", "-", "--method", "POST", "GET",
                        "--status", "200", "--until",
                        "2021-04-26T21:20:17Z"}),
              Err::Ok);

    MockWriter writer;
    {
        InSequence seq;
        EXPECT_CALL(writer, Begin()).WillOnce(Return(Err::Ok));
        EXPECT_CALL(writer, Write(Field(&core::AccessRecord::request_id, "fast")))
            .WillOnce(Return(Err::Ok));
        EXPECT_CALL(writer, Write(Field(&core::AccessRecord::request_id, "missing")))
            .WillOnce(Return(Err::Ok));
        EXPECT_CALL(writer, Finish()).WillOnce(Return(Err::Ok));
    }

    std::istringstream in(SampleLog());
    core::RunSummary summary{};
    EXPECT_EQ(core::Process(in, writer, summary), Err::Ok);
    EXPECT_EQ(summary.written, 2u);
}

TEST(PipelineTest, WriterFailureStopsExport) {
    ASSERT_EQ(InitFrom({"-i", "-", "-o", "-"}), Err::Ok);

    MockWriter writer;
    EXPECT_CALL(writer, Begin()).WillOnce(Return(Err::Ok));
    EXPECT_CALL(writer, Write(_)).WillOnce(Return(Err::OutputWriteFailed));
    EXPECT_CALL(writer, Finish()).Times(0);

    std::istringstream in(SampleLog());
    core::RunSummary summary{};
    EXPECT_EQ(core::Process(in, writer, summary), Err::OutputWriteFailed);
    EXPECT_EQ(summary.written, 0u);
    EXPECT_EQ(ExitCode(Err::OutputWriteFailed), 1);
}

TEST(PipelineTest, StrictStopsAtFirstBadLine) {
    ASSERT_EQ(InitFrom({"-i", "-", "-o", "-", "--strict"}), Err::Ok);

    MockWriter writer;
    EXPECT_CALL(writer, Begin()).Times(0);
    EXPECT_CALL(writer, Write(_)).Times(0);

    std::istringstream in(SampleLog());
    core::RunSummary summary{};
    EXPECT_EQ(core::Process(in, writer, summary), Err::MalformedLine);
}

TEST(PipelineTest, RunWritesCsvAndSummary) {
    TempDir dir;
    auto input = dir.Write("access.log", SampleLog());
    auto output = dir.path().string() + "/.//out.csv";
    auto shown = core::output::DisplayPath((dir.path() / "out.csv").string());

    testing::internal::CaptureStdout();
    int code = RunTool({"-i", input, "-o", output, "--path-contains", "login"});
    std::string stdout_text = testing::internal::GetCapturedStdout();

    EXPECT_EQ(code, 0);
    EXPECT_EQ(stdout_text, "OK: parsed=1 rows, skipped_bad_lines=1, output=" +
                               shown + "\n");

    auto csv = TempDir::Read(output);
    EXPECT_EQ(csv.rfind("remote_addr,time_local,time_utc,", 0), 0u);
    EXPECT_NE(csv.find(",POST,/login,/login,HTTP/1.1,200,"), std::string::npos);
    EXPECT_EQ(std::count(csv.begin(), csv.end(), '\n'), 2);
}

TEST(PipelineTest, RunWritesJsonlIntoNestedDirectory) {
    TempDir dir;
    auto input = dir.Write("access.log", SampleLog());
    auto output = (dir.path() / "a" / "b" / "out.jsonl").string();

    testing::internal::CaptureStdout();
    int code = RunTool({"-i", input, "-o", output, "-f", "jsonl",
                        "--limit", "-3"});
    testing::internal::GetCapturedStdout();

    ASSERT_EQ(code, 0);
    std::istringstream lines(TempDir::Read(output));
    std::string line;
    std::vector<std::string> ids;
    while (std::getline(lines, line)) {
        ids.push_back(
            nlohmann::json::parse(line)["request_id"].get<std::string>());
    }
    // Three records share the first timestamp and keep their input order.
    EXPECT_EQ(ids, (std::vector<std::string>{"slow"}));
}

TEST(PipelineTest, ExitCodes) {
    TempDir dir;
    auto input = dir.Write("access.log", SampleLog());
    auto output = (dir.path() / "strict" / "out.csv").string();

    EXPECT_EQ(RunTool({"-i", (dir.path() / "nope.log").string(), "-o",
                       output}),
              2);
    EXPECT_EQ(RunTool({"-i", input}), 2);
    EXPECT_EQ(RunTool({"-i", input, "-o", output, "--sort-by", "nope"}), 2);

    EXPECT_EQ(RunTool({"-i", input, "-o", output, "--strict"}), 3);
    EXPECT_FALSE(std::filesystem::exists(output));
}

TEST(OutputTest, SummaryPathIsNormalized) {
    using core::output::DisplayPath;
    EXPECT_EQ(DisplayPath("./out.csv"), "out.csv");
    EXPECT_EQ(DisplayPath("a//b.csv"), "a/b.csv");
    EXPECT_EQ(DisplayPath("a/./b/"), "a/b");
    EXPECT_EQ(DisplayPath("/tmp//x/out.csv"), "/tmp/x/out.csv");
    EXPECT_EQ(DisplayPath("a/../b.csv"), "a/../b.csv");
    EXPECT_EQ(DisplayPath("."), ".");
    EXPECT_EQ(DisplayPath("-"), "-");

    core::RunSummary summary{.written = 4, .bad_lines = 2,
                             .output = "./reports//out.csv"};
    testing::internal::CaptureStdout();
    core::output::PrintSummary(summary, false);
    EXPECT_EQ(testing::internal::GetCapturedStdout(),
              "OK: parsed=4 rows, skipped_bad_lines=2, output=reports/out.csv\n");
}

TEST(PreChecksTest, InputMustBeReadableFile) {
    TempDir dir;
    auto input = dir.Write("access.log", "");
    EXPECT_EQ(pre_checks::FileExists(input.c_str()), Err::Ok);
    EXPECT_EQ(pre_checks::FileExists(dir.path().string().c_str()),
              Err::FileNotFound);
    EXPECT_EQ(pre_checks::FileExists((dir.path() / "x").string().c_str()),
              Err::FileNotFound);
}

TEST(PreChecksTest, IdentityCheck) {
    EXPECT_EQ(pre_checks::RunningUnprivileged(false), Err::Ok);
    EXPECT_EQ(pre_checks::RunningUnprivileged(true),
              utils::IsPrivilegedUser() ? Err::PrivilegedUser : Err::Ok);
    EXPECT_EQ(ExitCode(Err::PrivilegedUser), 1);
}
