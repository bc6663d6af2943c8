#include "runner.hpp"
#include <errno.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <stdexcept>
#include <system_error>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "deadline.hpp"
#include "fs_observer.hpp"
#include "launcher.hpp"
#include "limits.hpp"
#include "output_collector.hpp"

namespace testbox {
using namespace std;

static chrono::nanoseconds to_duration(const struct timeval &tv) {
    return chrono::seconds(tv.tv_sec) + chrono::microseconds(tv.tv_usec);
}

termination_outcome classify_outcome(int status, bool deadline_fired, bool oom_killed,
                                     const resource_plan &plan, chrono::nanoseconds cpu_used) {
    int sig = WIFSIGNALED(status) ? WTERMSIG(status) : 0;

    if (deadline_fired)
        return termination_outcome::killed_by_deadline(sig);
    if (oom_killed)
        return termination_outcome::killed_by_resource_limit(limit_kind::memory, sig);

    if (WIFSIGNALED(status)) {
        if (sig == SIGXCPU)
            return termination_outcome::killed_by_resource_limit(limit_kind::cpu_time, sig);
        if (sig == SIGKILL) {
            // the hard CPU limit kills without a SIGXCPU the subject may have ignored
            const rlimit_setting *cpu = plan.find(RLIMIT_CPU);
            if (cpu && cpu_used >= chrono::seconds(cpu->soft))
                return termination_outcome::killed_by_resource_limit(limit_kind::cpu_time, sig);
        }
        if (sig == SIGXFSZ && plan.output_limit)
            return termination_outcome::killed_by_resource_limit(limit_kind::output_size, sig);
        return termination_outcome::exited_by_signal(sig);
    }

    return termination_outcome::exited_normally(WEXITSTATUS(status));
}

/**
 * @brief Blocks until the leader exits, leaving it unreaped
 */
static void wait_for_exit(pid_t pid) {
    siginfo_t info;
    while (waitid(P_PID, pid, &info, WEXITED | WNOWAIT) != 0) {
        if (errno != EINTR)
            throw system_error(errno, system_category(), fmt::format("waiting for subject {}", pid));
    }
}

static bool run_launched(const invocation_spec &spec, const resource_plan &plan, launched_process &process,
                         const fs_snapshot &before, result_assembler &assembler, bool &limits_held) {
    run_handle &handle = *process.handle;
    pid_t pid = handle.pid(), pgid = handle.process_group();
    bool leader_reaped = false;

    defer {
        if (!leader_reaped) waitpid(pid, nullptr, 0);
    };

    process_group_terminator terminator(pgid);
    output_collector collector(move(process.stdout_fd), move(process.stderr_fd), spec.stream_size);
    deadline_enforcer enforcer(handle, terminator, spec.time_limit, spec.grace_window);

    defer {
        if (!leader_reaped) {
            LOG(ERROR) << "harness failed while subject " << pid << " was running, killing its process group";
            kill(-pgid, SIGKILL);
        }
    };

    collector.start();
    enforcer.arm();

    wait_for_exit(pid);
    auto wall_time = chrono::steady_clock::now() - handle.start_time();
    handle.mark_exited();
    bool fired = enforcer.finish();

    int status;
    struct rusage usage;
    while (wait4(pid, &status, 0, &usage) < 0) {
        if (errno != EINTR)
            throw system_error(errno, system_category(), fmt::format("reaping subject {}", pid));
    }
    leader_reaped = true;

    bool stray = false;
    if (kill(-pgid, 0) == 0) {
        if (!fired) {
            LOG(WARNING) << "process group " << pgid << " outlived its leader, killing the rest";
            stray = true;
        }
        if (kill(-pgid, SIGKILL) != 0 && errno != ESRCH)
            throw system_error(errno, system_category(), fmt::format("killing process group {}", pgid));
    }

    collector.finish(DRAIN_TIMEOUT);

    limit_usage limit = read_limit_usage(plan);
    int swept = release_limits(plan);
    limits_held = false;
    if (swept > 0 && !fired) stray = true;

    auto user_time = to_duration(usage.ru_utime), sys_time = to_duration(usage.ru_stime);
    termination_outcome outcome = classify_outcome(status, fired, limit.oom_killed, plan, user_time + sys_time);
    LOG(INFO) << "subject " << pid << " finished: " << to_string(outcome.kind)
              << " after " << chrono::duration_cast<chrono::milliseconds>(wall_time).count() << "ms";

    assembler.set_outcome(outcome);
    assembler.set_streams(captured_stream(collector.take_stdout()), captured_stream(collector.take_stderr()));
    assembler.set_times(wall_time, user_time, sys_time);
    assembler.set_memory(limit.memory_bytes >= 0 ? limit.memory_bytes : (int64_t)usage.ru_maxrss * 1024);
    assembler.set_deadline(fired, enforcer.requests());
    assembler.set_stray_processes_killed(stray);

    fs_snapshot after = take_snapshot(spec.root, spec.observed_dir());
    assembler.set_fs_delta(diff_snapshots(before, after));

    assembler.emit();
    return true;
}

bool run_invocation(const invocation_spec &spec, result_sink &sink) {
    result_assembler assembler(sink);
    resource_plan plan;
    fs_snapshot before;
    launched_process process;
    bool limits_held = false;

    defer {
        if (limits_held) release_limits(plan);
    };

    try {
        validate_invocation(spec);
        plan = plan_limits(spec);
        check_launchable(spec);
        prepare_limits(plan);
        limits_held = true;
        before = take_snapshot(spec.root, spec.observed_dir());
        process = launch(spec, plan);
    } catch (setup_error &e) {
        assembler.emit_setup_error({e.kind(), e.what()});
        return false;
    } catch (system_error &e) {
        assembler.emit_setup_error({setup_error_kind::launch_failed, e.what()});
        return false;
    } catch (invalid_argument &e) {
        assembler.emit_setup_error({setup_error_kind::invalid_invocation, e.what()});
        return false;
    }

    try {
        return run_launched(spec, plan, process, before, assembler, limits_held);
    } catch (exception &e) {
        if (!assembler.emitted())
            assembler.emit_setup_error({setup_error_kind::internal, e.what()});
        throw internal_error(e.what());
    }
}

}  // namespace testbox
