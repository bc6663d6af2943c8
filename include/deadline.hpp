#pragma once

#include <sys/types.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>
#include "launcher.hpp"

namespace testbox {

enum class termination_level {
    /**
     * @brief Ask the subject to stop, SIGTERM
     */
    graceful,

    /**
     * @brief Stop the subject unconditionally, SIGKILL
     */
    forced
};

const char *to_string(termination_level level);

/**
 * @brief Cancellation token handed to the deadline enforcer.
 * The enforcer never sends signals itself, it only asks the token.
 */
struct termination_token {
    virtual ~termination_token();

    /**
     * @brief Delivers a termination request to every process of the subject.
     * Requesting termination of processes that are already gone is not an error.
     * @throw std::system_error when the request cannot be delivered
     */
    virtual void request(termination_level level) = 0;
};

/**
 * @brief Signals a whole process group, SIGTERM for graceful and SIGKILL
 * for forced termination.
 */
struct process_group_terminator : public termination_token {
    explicit process_group_terminator(pid_t pgid);

    void request(termination_level level) override;

private:
    pid_t pgid;
};

enum class escalation_step {
    /**
     * @brief Nothing to deliver, the subject finished before the deadline
     */
    none,

    /**
     * @brief Deliver the graceful request
     */
    graceful,

    /**
     * @brief Keep waiting for the grace window to elapse
     */
    wait,

    /**
     * @brief Deliver the forced request
     */
    forced
};

const char *to_string(escalation_step step);

/**
 * @brief What the enforcer has to do next.
 *
 * | phase       | fired | grace elapsed | step     |
 * |-------------|-------|---------------|----------|
 * | launched    | -     | -             | graceful |
 * | running     | -     | -             | graceful |
 * | terminating | -     | no            | wait     |
 * | terminating | -     | yes           | forced   |
 * | exited      | yes   | -             | forced   |
 * | exited      | no    | -             | none     |
 *
 * Once the deadline fired the forced request is always delivered, even
 * if the leader exited within the grace window, so that members of the
 * process group that ignored SIGTERM do not survive.
 */
escalation_step decide_escalation(run_phase phase, bool fired, bool grace_elapsed);

/**
 * @brief Wall clock timer bound to one run handle.
 *
 * arm() moves the handle to running and starts a thread waiting for the
 * deadline. When the deadline passes while the subject still runs, the
 * enforcer claims running -> terminating, requests graceful termination,
 * waits for the grace window and then requests forced termination.
 *
 * finish() must be called once the harness has confirmed the leader
 * exited (and has marked the handle exited), and before the leader is
 * reaped, so that the process group id cannot be reused while the
 * enforcer may still signal it.
 */
struct deadline_enforcer {
    deadline_enforcer(run_handle &handle, termination_token &token,
                      std::chrono::milliseconds time_limit,
                      std::chrono::milliseconds grace_window);

    deadline_enforcer(const deadline_enforcer &) = delete;
    deadline_enforcer &operator=(const deadline_enforcer &) = delete;

    /**
     * @brief Joins the timer thread if finish() has not been called.
     * Delivery failures are dropped (and logged) in that case.
     */
    ~deadline_enforcer();

    /**
     * @brief Starts the timer. The deadline is measured from the start
     * time of the run handle.
     * @throw std::logic_error when armed twice
     */
    void arm();

    /**
     * @brief Cancels a pending deadline, or completes an escalation in
     * progress, and joins the timer thread.
     * @return true if the deadline fired
     * @throw std::system_error rethrown from a failed delivery
     */
    bool finish();

    bool fired() const;

    /**
     * @brief Termination requests delivered so far, in order
     */
    std::vector<termination_level> requests() const;

    /**
     * @brief Number of enforcers armed by this process so far
     */
    static std::size_t armed_count();

private:
    void run();
    void deliver(termination_level level);

    run_handle &handle;
    termination_token &token;
    std::chrono::milliseconds time_limit, grace_window;

    mutable std::mutex mut;
    std::condition_variable cv;
    bool armed = false, stopping = false, has_fired = false;
    std::vector<termination_level> delivered;
    std::exception_ptr failure;
    std::thread worker;

    static std::atomic<std::size_t> armed_total;
};

}  // namespace testbox
