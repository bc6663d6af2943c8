#include <signal.h>
#include <unistd.h>
#include <chrono>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <thread>
#include "common/io_utils.hpp"
#include "config.hpp"
#include "deadline.hpp"
#include "launcher.hpp"
#include "gtest/gtest.h"
#include "runner.hpp"
#include "test/subject.hpp"

using namespace std;
using namespace testbox;
namespace fs = std::filesystem;

class RunnerTest : public ::testing::Test {
protected:
    temp_directory workdir;
    collecting_sink sink;

    const result_record &run(const invocation_spec &spec) {
        EXPECT_TRUE(run_invocation(spec, sink));
        EXPECT_EQ(sink.records, 1);
        if (!sink.result) throw runtime_error("no result record emitted");
        return *sink.result;
    }

    const fs_change *find(const vector<fs_change> &delta, const string &path) {
        for (auto &change : delta)
            if (change.path == path) return &change;
        return nullptr;
    }
};

TEST_F(RunnerTest, NaturalExitBeforeDeadline) {
    size_t handles = run_handle::created_count(), armed = deadline_enforcer::armed_count();
    const result_record &result = run(shell_invocation("echo hello; echo warn >&2; exit 0", workdir.path()));
    EXPECT_EQ(run_handle::created_count(), handles + 1);
    EXPECT_EQ(deadline_enforcer::armed_count(), armed + 1);

    EXPECT_EQ(result.outcome, termination_outcome::exited_normally(0));
    EXPECT_EQ(result.stdout_stream.data, "hello\n");
    EXPECT_EQ(result.stderr_stream.data, "warn\n");
    EXPECT_FALSE(result.deadline_fired);
    EXPECT_TRUE(result.termination_requests.empty());
    EXPECT_FALSE(result.stray_processes_killed);
    EXPECT_TRUE(result.fs_delta.empty());
    EXPECT_LT(result.wall_time, chrono::seconds(5));
}

TEST_F(RunnerTest, ExitCodeIsReported) {
    const result_record &result = run(shell_invocation("exit 42", workdir.path()));
    EXPECT_EQ(result.outcome.kind, outcome_kind::exited_normally);
    EXPECT_EQ(result.outcome.exit_code, 42);
}

TEST_F(RunnerTest, SignalIsNotANormalExit) {
    const result_record &result = run(shell_invocation("kill -SEGV $$", workdir.path()));
    EXPECT_EQ(result.outcome, termination_outcome::exited_by_signal(SIGSEGV));
}

TEST_F(RunnerTest, DeadlineTerminatesSleepingSubject) {
    auto begin = chrono::steady_clock::now();
    invocation_spec spec = shell_invocation("echo started; sleep 30", workdir.path(), chrono::milliseconds(300));
    spec.grace_window = chrono::milliseconds(200);
    const result_record &result = run(spec);
    auto elapsed = chrono::steady_clock::now() - begin;

    EXPECT_EQ(result.outcome.kind, outcome_kind::killed_by_deadline);
    EXPECT_TRUE(result.deadline_fired);
    ASSERT_FALSE(result.termination_requests.empty());
    EXPECT_EQ(result.termination_requests.front(), termination_level::graceful);
    EXPECT_EQ(result.termination_requests.back(), termination_level::forced);
    EXPECT_EQ(result.stdout_stream.data, "started\n");
    EXPECT_GE(result.wall_time, chrono::milliseconds(300));
    // deadline, grace window and a small constant
    EXPECT_LT(elapsed, chrono::seconds(3));
}

TEST_F(RunnerTest, SubjectIgnoringTermAndForkingIsFullyTerminated) {
    fs::path pid_file = workdir.path() / "children";
    invocation_spec spec = shell_invocation(
        "trap '' TERM; "
        "(trap '' TERM; sleep 60) & echo $! >> children; "
        "(trap '' TERM; sleep 60) & echo $! >> children; "
        "while true; do sleep 1; done",
        workdir.path(), chrono::milliseconds(300));
    spec.grace_window = chrono::milliseconds(200);

    auto begin = chrono::steady_clock::now();
    const result_record &result = run(spec);
    EXPECT_LT(chrono::steady_clock::now() - begin, chrono::seconds(3));
    EXPECT_EQ(result.outcome.kind, outcome_kind::killed_by_deadline);
    EXPECT_EQ(result.outcome.signal, SIGKILL);

    const fs_change *children = find(result.fs_delta, (workdir.path() / "children").string());
    ASSERT_NE(children, nullptr);
    EXPECT_EQ(children->kind, change_kind::created);

    // orphans are reaped by init, give it a moment
    this_thread::sleep_for(chrono::milliseconds(100));
    istringstream pids(read_file_content(pid_file));
    pid_t child;
    int count = 0;
    while (pids >> child) {
        ++count;
        EXPECT_FALSE(process_alive(child)) << "child " << child << " survived";
    }
    EXPECT_EQ(count, 2);
}

TEST_F(RunnerTest, StrayProcessesAfterNaturalExitAreKilled) {
    invocation_spec spec = shell_invocation("sleep 60 > /dev/null 2>&1 & echo $! > stray; exit 0", workdir.path());
    const result_record &result = run(spec);

    EXPECT_EQ(result.outcome, termination_outcome::exited_normally(0));
    EXPECT_FALSE(result.deadline_fired);
    EXPECT_TRUE(result.termination_requests.empty());
    EXPECT_TRUE(result.stray_processes_killed);

    this_thread::sleep_for(chrono::milliseconds(100));
    pid_t stray = stoi(read_file_content(workdir.path() / "stray"));
    EXPECT_FALSE(process_alive(stray));
}

TEST_F(RunnerTest, OutputAboveCapIsTruncated) {
    invocation_spec spec = shell_invocation(
        "i=0; while [ $i -lt 2000 ]; do echo 0123456789012345678901234567890123456789; i=$((i+1)); done",
        workdir.path());
    spec.stream_size = 1000;

    const result_record &result = run(spec);
    EXPECT_EQ(result.outcome, termination_outcome::exited_normally(0));
    EXPECT_TRUE(result.stdout_stream.truncated);
    EXPECT_EQ(result.stdout_stream.data.size(), 1000u);
    EXPECT_EQ(result.stdout_stream.total_bytes, 2000u * 41);
    EXPECT_FALSE(result.stderr_stream.truncated);
}

TEST_F(RunnerTest, FilesystemDeltaOfTheWorkingDirectory) {
    write_file_content(workdir.path() / "keep.txt", "keep");
    write_file_content(workdir.path() / "edit.txt", "old");
    write_file_content(workdir.path() / "gone.txt", "gone");

    const result_record &result = run(shell_invocation(
        "echo new > out.txt; echo changed > edit.txt; rm gone.txt", workdir.path()));

    string base = workdir.path().string();
    ASSERT_EQ(result.fs_delta.size(), 3u);
    EXPECT_EQ(result.fs_delta[0].path, base + "/edit.txt");
    EXPECT_EQ(result.fs_delta[0].kind, change_kind::modified);
    EXPECT_EQ(result.fs_delta[1].path, base + "/gone.txt");
    EXPECT_EQ(result.fs_delta[1].kind, change_kind::deleted);
    EXPECT_EQ(result.fs_delta[2].path, base + "/out.txt");
    EXPECT_EQ(result.fs_delta[2].kind, change_kind::created);
    EXPECT_EQ(find(result.fs_delta, base + "/keep.txt"), nullptr);
}

TEST_F(RunnerTest, NonUtf8FileNameStillYieldsOneRecord) {
    stringstream out;
    json_stream_sink json_sink(out);
    EXPECT_TRUE(run_invocation(shell_invocation("touch \"$(printf 'bad\\377')\"", workdir.path()), json_sink));

    vector<string> lines;
    string line;
    while (getline(out, line)) lines.push_back(line);
    ASSERT_EQ(lines.size(), 1u);

    nlohmann::json record = nlohmann::json::parse(lines[0]);
    EXPECT_EQ(record["type"], "result");
    ASSERT_EQ(record["fs_delta"].size(), 1u);
    EXPECT_EQ(record["fs_delta"][0]["kind"], "created");
    EXPECT_EQ(record["fs_delta"][0]["encoding"], "base64");
}

TEST_F(RunnerTest, OutputSizeLimit) {
    invocation_spec spec = shell_invocation("head -c 100000 /dev/zero > big.bin", workdir.path());
    spec.output_limit = 4096;

    const result_record &result = run(spec);
    // the shell itself is not killed, head is
    EXPECT_NE(result.outcome, termination_outcome::exited_normally(0));
}

TEST_F(RunnerTest, OutputSizeLimitOfTheLeader) {
    invocation_spec spec = shell_invocation("exec head -c 100000 /dev/zero > big.bin", workdir.path());
    spec.output_limit = 4096;

    const result_record &result = run(spec);
    EXPECT_EQ(result.outcome.kind, outcome_kind::killed_by_resource_limit);
    EXPECT_EQ(result.outcome.limit, optional<limit_kind>(limit_kind::output_size));
}

TEST_F(RunnerTest, CpuTimeLimit) {
    invocation_spec spec = shell_invocation("while true; do :; done", workdir.path(), chrono::seconds(10));
    spec.cpu_limit = chrono::seconds(1);

    const result_record &result = run(spec);
    EXPECT_EQ(result.outcome.kind, outcome_kind::killed_by_resource_limit);
    EXPECT_EQ(result.outcome.limit, optional<limit_kind>(limit_kind::cpu_time));
    EXPECT_FALSE(result.deadline_fired);
}

TEST_F(RunnerTest, MemoryLimit) {
    if (!running_as_root()) GTEST_SKIP() << "memory cgroups require root privilege";

    invocation_spec spec = shell_invocation("x=a; while true; do x=$x$x; done", workdir.path(), chrono::seconds(10));
    spec.memory_limit = 32 << 20;

    const result_record &result = run(spec);
    EXPECT_EQ(result.outcome.kind, outcome_kind::killed_by_resource_limit);
    EXPECT_EQ(result.outcome.limit, optional<limit_kind>(limit_kind::memory));
    EXPECT_GT(result.memory_bytes, 0);
}

TEST_F(RunnerTest, MissingProgramIsASetupError) {
    invocation_spec spec = shell_invocation("", workdir.path());
    spec.program = "no-such-program";

    size_t handles = run_handle::created_count(), armed = deadline_enforcer::armed_count();
    EXPECT_FALSE(run_invocation(spec, sink));
    EXPECT_EQ(sink.records, 1);
    EXPECT_FALSE(sink.result);
    ASSERT_TRUE(sink.error);
    EXPECT_EQ(sink.error->kind, setup_error_kind::program_missing);

    // rejected before anything was started
    EXPECT_EQ(run_handle::created_count(), handles);
    EXPECT_EQ(deadline_enforcer::armed_count(), armed);
}

TEST_F(RunnerTest, InvalidInvocationIsASetupError) {
    invocation_spec spec = shell_invocation("true", workdir.path(), chrono::milliseconds(0));

    EXPECT_FALSE(run_invocation(spec, sink));
    ASSERT_TRUE(sink.error);
    EXPECT_EQ(sink.error->kind, setup_error_kind::invalid_invocation);
}

TEST_F(RunnerTest, MissingWorkDirIsASetupError) {
    invocation_spec spec = shell_invocation("true", workdir.path() / "missing");

    EXPECT_FALSE(run_invocation(spec, sink));
    ASSERT_TRUE(sink.error);
    EXPECT_EQ(sink.error->kind, setup_error_kind::workdir_missing);
}

TEST_F(RunnerTest, RunningAsRootIsRefused) {
    if (!running_as_root()) GTEST_SKIP() << "switching users requires root privilege";

    invocation_spec spec = shell_invocation("id -u", workdir.path());
    spec.user_id = 0;
    spec.group_id = 0;

    EXPECT_FALSE(run_invocation(spec, sink));
    ASSERT_TRUE(sink.error);
    EXPECT_EQ(sink.error->kind, setup_error_kind::privilege);
}
