#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/run_id.hpp"
#include "core/errors/station_errors.hpp"
#include "protocol/run_execution_contract.hpp"
#include "runtime/step.hpp"
#include "session/run_report_writer.hpp"

namespace {

using station::core::errors::ErrorCategory;
using station::core::errors::get_error;
using station::core::errors::get_value;
using station::core::errors::is_error;
using station::core::errors::StationError;
using station::protocol::LogLine;
using station::protocol::LogStream;
using station::protocol::OutcomeKind;
using station::protocol::RunResult;
using station::protocol::RunVerdict;
using station::protocol::StepExecution;
using station::protocol::StopReason;
using station::runtime::StepMetadata;
using station::session::RunReportWriter;
using nlohmann::json;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_run_report_" + station::core::config::generate_run_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

std::vector<std::string> read_lines(const std::filesystem::path& file_path) {
    std::vector<std::string> lines;
    std::ifstream in(file_path);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

RunResult make_result(const std::string& run_id) {
    RunResult result;
    result.run_id = run_id;
    result.verdict = RunVerdict::Failed;
    result.stop_reason = StopReason::InfrastructureError;
    result.infrastructure_error =
        StationError{ErrorCategory::Infrastructure, "Request req-1 cancelled",
                     "interaction_cancelled"};
    result.summary = "1 passed, 1 failed, 1 skipped; finalizer passed";

    StepExecution first;
    first.info = StepMetadata("EmptyStep").resolve();
    first.outcome = {OutcomeKind::Passed, ""};
    first.logs.push_back(LogLine{LogStream::Out, "This goes to stdout",
                                 std::chrono::system_clock::now()});
    first.logs.push_back(LogLine{LogStream::Err, "This goes to stderr",
                                 std::chrono::system_clock::now()});
    result.steps.push_back(first);

    StepExecution second;
    second.info = StepMetadata("PassFailButtons").resolve();
    second.outcome = {OutcomeKind::Errored, "Request req-1 cancelled"};
    result.steps.push_back(second);

    StepExecution third;
    third.info = StepMetadata("StepWithImage").image("station/img/puppy.jpg").resolve();
    third.outcome = {OutcomeKind::Skipped, ""};
    result.steps.push_back(third);

    StepExecution finalizer;
    finalizer.info = StepMetadata("Shutdown").resolve();
    finalizer.outcome = {OutcomeKind::Passed, ""};
    result.finalizer = finalizer;
    return result;
}

TEST(RunReportWriterTest, WritesStartStepsFinalizerAndVerdict) {
    TempWorkspace workspace;
    RunReportWriter writer(workspace.root() / "reports");
    const std::string run_id = "run-report-1";

    const auto started = writer.write_started(run_id, 3);
    ASSERT_FALSE(is_error(started));
    const auto report_path = get_value(started);
    EXPECT_TRUE(std::filesystem::exists(report_path));

    const auto finished = writer.write_result(make_result(run_id));
    ASSERT_FALSE(is_error(finished));

    const auto lines = read_lines(report_path);
    ASSERT_EQ(lines.size(), 6u);

    const auto start_event = json::parse(lines[0]);
    EXPECT_EQ(start_event.at("event").get<std::string>(), "run_started");
    EXPECT_EQ(start_event.at("run_id").get<std::string>(), run_id);
    EXPECT_EQ(start_event.at("payload").at("step_count").get<int>(), 3);

    const auto step_event = json::parse(lines[1]);
    EXPECT_EQ(step_event.at("event").get<std::string>(), "step");
    EXPECT_EQ(step_event.at("payload").at("display_name").get<std::string>(), "Empty Step");
    EXPECT_EQ(step_event.at("payload").at("outcome").get<std::string>(), "passed");
    ASSERT_EQ(step_event.at("payload").at("logs").size(), 2u);
    EXPECT_EQ(step_event.at("payload").at("logs")[1].at("stream").get<std::string>(), "err");

    const auto skipped_event = json::parse(lines[3]);
    EXPECT_EQ(skipped_event.at("payload").at("outcome").get<std::string>(), "skipped");
    EXPECT_EQ(skipped_event.at("payload").at("image").get<std::string>(),
              "station/img/puppy.jpg");

    const auto finalizer_event = json::parse(lines[4]);
    EXPECT_EQ(finalizer_event.at("event").get<std::string>(), "finalizer");

    const auto final_event = json::parse(lines[5]);
    EXPECT_EQ(final_event.at("event").get<std::string>(), "run_finished");
    EXPECT_EQ(final_event.at("payload").at("verdict").get<std::string>(), "failed");
    EXPECT_EQ(final_event.at("payload").at("stop_reason").get<std::string>(),
              "infrastructure_error");
    EXPECT_EQ(final_event.at("payload").at("infrastructure_error").at("code").get<std::string>(),
              "interaction_cancelled");
    EXPECT_FALSE(final_event.at("payload").contains("steps"));
}

TEST(RunReportWriterTest, ResultJsonCarriesEveryRecord) {
    const auto payload = station::session::run_result_to_json(make_result("run-report-2"));
    EXPECT_EQ(payload.at("steps").size(), 3u);
    EXPECT_EQ(payload.at("finalizer").at("identifier").get<std::string>(), "Shutdown");
    EXPECT_EQ(payload.at("steps")[1].at("detail").get<std::string>(),
              "Request req-1 cancelled");
}

TEST(RunReportWriterTest, FailsWhenReportDirIsAFile) {
    TempWorkspace workspace;
    const auto file_path = workspace.root() / "not-a-dir";
    {
        std::ofstream out(file_path);
        out << "x";
    }

    RunReportWriter writer(file_path);
    auto result = writer.write_started("run-report-3", 1);
    ASSERT_TRUE(is_error(result));
}

TEST(RunReportWriterTest, RejectsEmptyRunId) {
    TempWorkspace workspace;
    RunReportWriter writer(workspace.root());
    auto result = writer.write_started("", 1);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_run_id");
}

}  // namespace
