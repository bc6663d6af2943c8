#include "launcher.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <grp.h>
#include <linux/close_range.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>
#include "cgroup.hpp"
#include "common/exceptions.hpp"
#include "invocation.hpp"
#include "limits.hpp"

namespace testbox {
using namespace std;
namespace fs = std::filesystem;

const char *to_string(run_phase phase) {
    switch (phase) {
        case run_phase::launched: return "launched";
        case run_phase::running: return "running";
        case run_phase::terminating: return "terminating";
        case run_phase::exited: return "exited";
    }
    return "unknown";
}

bool is_legal_transition(run_phase from, run_phase to) {
    switch (from) {
        case run_phase::launched:
            return to == run_phase::running || to == run_phase::exited;
        case run_phase::running:
            return to == run_phase::terminating || to == run_phase::exited;
        case run_phase::terminating:
            return to == run_phase::exited;
        case run_phase::exited:
            return false;
    }
    return false;
}

atomic<size_t> run_handle::created{0};

run_handle::run_handle(pid_t pid, chrono::steady_clock::time_point start_time)
    : child_pid(pid), started(start_time), current(run_phase::launched) {
    ++created;
}

size_t run_handle::created_count() {
    return created;
}

pid_t run_handle::pid() const {
    return child_pid;
}

pid_t run_handle::process_group() const {
    return child_pid;
}

chrono::steady_clock::time_point run_handle::start_time() const {
    return started;
}

run_phase run_handle::phase() const {
    return current.load();
}

bool run_handle::advance(run_phase from, run_phase to) {
    if (!is_legal_transition(from, to))
        throw logic_error(fmt::format("illegal phase transition {} -> {}", to_string(from), to_string(to)));
    if (!current.compare_exchange_strong(from, to))
        return false;
    DLOG(INFO) << "subject " << child_pid << ": " << to_string(from) << " -> " << to_string(to);
    return true;
}

run_phase run_handle::mark_exited() {
    run_phase phase = current.load();
    while (true) {
        if (phase == run_phase::exited)
            throw logic_error("subject already marked as exited");
        if (current.compare_exchange_weak(phase, run_phase::exited))
            return phase;
    }
}

/**
 * Steps of the child between fork and exec, reported back on failure.
 */
enum class launch_stage : int {
    limits,
    setsid,
    stdin,
    chroot,
    chdir,
    setgid,
    setuid,
    still_root,
    redirect,
    signals,
    exec
};

static const char *stage_name(launch_stage stage) {
    switch (stage) {
        case launch_stage::limits: return "applying resource limits";
        case launch_stage::setsid: return "creating process group";
        case launch_stage::chroot: return "entering isolated root";
        case launch_stage::chdir: return "changing to working directory";
        case launch_stage::stdin: return "opening standard input";
        case launch_stage::setgid: return "setting group id";
        case launch_stage::setuid: return "setting user id";
        case launch_stage::still_root: return "dropping root privileges";
        case launch_stage::redirect: return "redirecting standard streams";
        case launch_stage::signals: return "resetting signal mask";
        case launch_stage::exec: return "executing program";
    }
    return "launching";
}

struct child_report {
    launch_stage stage;
    int err;
    char message[256];
};

/**
 * Everything the child needs, prepared before fork so that the child
 * only has to pass pointers around.
 */
struct child_context {
    const resource_plan *plan;
    bool use_chroot;
    string root;
    string work_dir;
    string stdin_path;
    string exec_path;
    int user_id, group_id;
    vector<string> arg_storage, env_storage;
    vector<char *> argv, envp;
    int stdout_fd, stderr_fd, report_fd;
};

[[noreturn]] static void child_die(int report_fd, launch_stage stage, int err, const char *message) {
    child_report report;
    memset(&report, 0, sizeof(report));
    report.stage = stage;
    report.err = err;
    if (message) strncpy(report.message, message, sizeof(report.message) - 1);
    const char *p = (const char *)&report;
    size_t left = sizeof(report);
    while (left > 0) {
        ssize_t n = write(report_fd, p, left);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        p += n;
        left -= n;
    }
    _exit(127);
}

static void mark_inherited_fds_cloexec() {
    // the subject must not see any descriptor of the harness except 0, 1, 2
    if (syscall(__NR_close_range, 3, ~0U, CLOSE_RANGE_CLOEXEC) == 0) return;
    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0 || max_fd > 65536) max_fd = 65536;
    for (int fd = 3; fd < max_fd; ++fd)
        fcntl(fd, F_SETFD, FD_CLOEXEC);
}

[[noreturn]] static void run_child(const child_context &ctx) {
    int report_fd = ctx.report_fd;
    auto die = [report_fd](launch_stage stage, int err, const char *message = nullptr) {
        child_die(report_fd, stage, err, message);
    };

    try {
        apply_limits(*ctx.plan);
    } catch (system_error &e) {
        die(launch_stage::limits, e.code().value(), e.what());
    } catch (cgroup_exception &e) {
        die(launch_stage::limits, 0, e.what());
    }

    // leader of a new session and process group, so the subject and
    // everything it forks can be signalled at once
    if (setsid() == -1) die(launch_stage::setsid, errno);

    // opened through the host path, the isolated root needs no /dev/null
    int stdin_fd = open(ctx.stdin_path.c_str(), O_RDONLY);
    if (stdin_fd < 0) die(launch_stage::stdin, errno);

    if (ctx.use_chroot) {
        if (chroot(ctx.root.c_str()) != 0) die(launch_stage::chroot, errno);
        if (chdir("/") != 0) die(launch_stage::chroot, errno);
    }
    if (chdir(ctx.work_dir.c_str()) != 0) die(launch_stage::chdir, errno);

    if (ctx.group_id >= 0) {
        gid_t gid = ctx.group_id;
        if (setgid(gid) != 0) die(launch_stage::setgid, errno);
        if (setgroups(1, &gid) != 0) die(launch_stage::setgid, errno);
    }
    if (ctx.user_id >= 0) {
        if (setuid(ctx.user_id) != 0) die(launch_stage::setuid, errno);
        if (geteuid() == 0 || getuid() == 0) die(launch_stage::still_root, EPERM);
    }

    if (dup2(stdin_fd, STDIN_FILENO) < 0) die(launch_stage::redirect, errno);
    if (stdin_fd != STDIN_FILENO) close(stdin_fd);
    if (dup2(ctx.stdout_fd, STDOUT_FILENO) < 0) die(launch_stage::redirect, errno);
    if (dup2(ctx.stderr_fd, STDERR_FILENO) < 0) die(launch_stage::redirect, errno);
    mark_inherited_fds_cloexec();

    sigset_t emptymask;
    if (sigemptyset(&emptymask) != 0) die(launch_stage::signals, errno);
    if (sigprocmask(SIG_SETMASK, &emptymask, nullptr) != 0) die(launch_stage::signals, errno);
    for (int sig : {SIGPIPE, SIGTERM, SIGINT, SIGHUP, SIGQUIT, SIGXCPU, SIGXFSZ}) {
        if (signal(sig, SIG_DFL) == SIG_ERR) die(launch_stage::signals, errno);
    }

    execve(ctx.exec_path.c_str(), ctx.argv.data(), ctx.envp.data());
    die(launch_stage::exec, errno);
}

static setup_error_kind classify_report(const child_report &report) {
    switch (report.stage) {
        case launch_stage::limits:
            return report.err == EPERM ? setup_error_kind::privilege : setup_error_kind::limit_failed;
        case launch_stage::chroot:
        case launch_stage::setgid:
        case launch_stage::setuid:
        case launch_stage::still_root:
            return report.err == EPERM ? setup_error_kind::privilege : setup_error_kind::launch_failed;
        case launch_stage::chdir:
            return setup_error_kind::workdir_missing;
        case launch_stage::stdin:
            return report.err == ENOENT ? setup_error_kind::stdin_missing : setup_error_kind::launch_failed;
        case launch_stage::exec:
            if (report.err == ENOENT || report.err == ENOTDIR) return setup_error_kind::program_missing;
            if (report.err == EACCES || report.err == ENOEXEC) return setup_error_kind::not_executable;
            return setup_error_kind::launch_failed;
        default:
            return setup_error_kind::launch_failed;
    }
}

void check_launchable(const invocation_spec &spec) {
    error_code ec;
    if (!fs::is_directory(spec.root, ec))
        throw setup_error(setup_error_kind::root_missing,
                          fmt::format("isolated root {} does not exist", spec.root.string()));

    fs::path program = spec.host_program();
    struct stat st;
    if (stat(program.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR)
            throw setup_error(setup_error_kind::program_missing,
                              fmt::format("program {} does not exist in {}", spec.exec_path().string(), spec.root.string()));
        throw setup_error(setup_error_kind::not_executable,
                          fmt::format("cannot access program {}: {}", spec.exec_path().string(), strerror(errno)));
    }
    if (!S_ISREG(st.st_mode) || !(st.st_mode & (S_IXUSR | S_IXGRP | S_IXOTH)))
        throw setup_error(setup_error_kind::not_executable,
                          fmt::format("program {} is not an executable file", spec.exec_path().string()));

    if (!fs::is_directory(spec.host_work_dir(), ec))
        throw setup_error(setup_error_kind::workdir_missing,
                          fmt::format("working directory {} does not exist", spec.work_dir.string()));

    if (!spec.stdin_file.empty() && !fs::is_regular_file(spec.host_stdin_file(), ec))
        throw setup_error(setup_error_kind::stdin_missing,
                          fmt::format("standard input file {} does not exist", spec.stdin_file.string()));
}

launched_process launch(const invocation_spec &spec, const resource_plan &plan) {
    child_context ctx;
    ctx.plan = &plan;
    ctx.use_chroot = spec.uses_chroot();
    ctx.root = spec.root.string();
    ctx.work_dir = spec.work_dir.string();
    ctx.stdin_path = spec.stdin_file.empty() ? "/dev/null" : spec.host_stdin_file().string();
    ctx.exec_path = spec.exec_path().string();
    ctx.user_id = spec.user_id;
    ctx.group_id = spec.group_id;

    ctx.arg_storage.push_back(ctx.exec_path);
    ctx.arg_storage.insert(ctx.arg_storage.end(), spec.args.begin(), spec.args.end());
    for (auto &[key, value] : spec.env)
        ctx.env_storage.push_back(key + "=" + value);
    for (auto &arg : ctx.arg_storage) ctx.argv.push_back(arg.data());
    ctx.argv.push_back(nullptr);
    for (auto &env : ctx.env_storage) ctx.envp.push_back(env.data());
    ctx.envp.push_back(nullptr);

    unique_fd stdout_read, stdout_write, stderr_read, stderr_write, report_read, report_write;
    make_pipe(stdout_read, stdout_write);
    make_pipe(stderr_read, stderr_write);
    make_pipe(report_read, report_write);
    ctx.stdout_fd = stdout_write.get();
    ctx.stderr_fd = stderr_write.get();
    ctx.report_fd = report_write.get();

    LOG(INFO) << "launching " << boost::algorithm::join(ctx.arg_storage, " ")
              << " in " << spec.root << " (workdir " << spec.work_dir << ")";

    pid_t pid = fork();
    if (pid == -1)
        throw setup_error(setup_error_kind::launch_failed, fmt::format("unable to fork: {}", strerror(errno)));
    if (pid == 0)
        run_child(ctx);

    auto start_time = chrono::steady_clock::now();
    stdout_write.reset();
    stderr_write.reset();
    report_write.reset();

    // EOF without a report means execve succeeded and closed the pipe
    child_report report;
    size_t received = 0;
    while (received < sizeof(report)) {
        ssize_t n = read(report_read.get(), (char *)&report + received, sizeof(report) - received);
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) {
            int err = errno;
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            throw setup_error(setup_error_kind::launch_failed,
                              fmt::format("reading launch report: {}", strerror(err)));
        }
        if (n == 0) break;
        received += n;
    }

    if (received > 0) {
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        if (received < sizeof(report))
            throw setup_error(setup_error_kind::launch_failed, "truncated launch report from child");
        report.message[sizeof(report.message) - 1] = '\0';
        string message = fmt::format("{} failed: {}", stage_name(report.stage),
                                     report.message[0] ? report.message : strerror(report.err));
        LOG(ERROR) << "launch of " << ctx.exec_path << " failed, " << message;
        throw setup_error(classify_report(report), message);
    }

    LOG(INFO) << "subject started with pid " << pid;

    launched_process process;
    process.handle = make_unique<run_handle>(pid, start_time);
    process.stdout_fd = move(stdout_read);
    process.stderr_fd = move(stderr_read);
    return process;
}

}  // namespace testbox
