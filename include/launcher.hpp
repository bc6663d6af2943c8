#pragma once

#include <sys/types.h>
#include <atomic>
#include <chrono>
#include <memory>
#include "common/io_utils.hpp"

namespace testbox {

struct invocation_spec;
struct resource_plan;

/**
 * @brief Lifecycle of one subject process.
 *
 * launched ──> running ──> terminating ──> exited
 *    │            │                          ▲
 *    └────────────┴──────────────────────────┘
 *
 * running -> terminating is claimed by the deadline enforcer, -> exited by
 * the harness once it has confirmed the leader is gone. No other
 * transition is legal.
 */
enum class run_phase {
    launched,
    running,
    terminating,
    exited
};

const char *to_string(run_phase phase);

bool is_legal_transition(run_phase from, run_phase to);

/**
 * @brief One in-flight execution of the subject.
 * The subject is the leader of its own process group, so the process
 * group id equals the pid.
 */
struct run_handle {
    run_handle(pid_t pid, std::chrono::steady_clock::time_point start_time);

    run_handle(const run_handle &) = delete;
    run_handle &operator=(const run_handle &) = delete;

    pid_t pid() const;

    pid_t process_group() const;

    std::chrono::steady_clock::time_point start_time() const;

    run_phase phase() const;

    /**
     * @brief Atomically moves from one phase to another
     * @return false when the handle is not in phase from
     * @throw std::logic_error when from -> to is not a legal transition
     */
    bool advance(run_phase from, run_phase to);

    /**
     * @brief Moves to exited from whatever phase the handle is in
     * @return the phase that was left
     * @throw std::logic_error when the handle already is exited
     */
    run_phase mark_exited();

    /**
     * @brief Number of run handles created by this process so far
     */
    static std::size_t created_count();

private:
    pid_t child_pid;
    std::chrono::steady_clock::time_point started;
    std::atomic<run_phase> current;

    static std::atomic<std::size_t> created;
};

/**
 * @brief A started subject together with the read ends of its output pipes
 */
struct launched_process {
    std::unique_ptr<run_handle> handle;
    unique_fd stdout_fd;
    unique_fd stderr_fd;
};

/**
 * @brief Checks that the isolated root, the program, the working directory
 * and the stdin file are all in place. Nothing is allocated.
 * @throw setup_error naming what is missing
 */
void check_launchable(const invocation_spec &spec);

/**
 * @brief Starts the subject and returns as soon as it runs the program.
 *
 * The child becomes leader of a new session and process group, applies
 * the resource plan, enters the isolated root, drops privileges, connects
 * stdin to a file (or /dev/null) and stdout/stderr to pipes, and execs the
 * program with exactly the invocation's environment. If any of these steps
 * fails the child reports it through a close-on-exec pipe, it is reaped and
 * the failure is thrown here.
 *
 * Must be called while the harness runs a single thread.
 *
 * @throw setup_error of kind launch_failed, privilege, limit_failed,
 * program_missing or not_executable
 */
launched_process launch(const invocation_spec &spec, const resource_plan &plan);

}  // namespace testbox
