#pragma once

#include "invocation.hpp"
#include "result.hpp"

namespace testbox {

/**
 * @brief Runs one subject program under a deadline and reports how it went.
 *
 * Exactly one record reaches the sink: a result record once the subject
 * was launched, whatever the subject did, or a setup-error record when the
 * subject could not be started. Nothing acquired for the run (cgroup,
 * pipes, threads, processes) outlives this call.
 *
 * The isolated root must not be used by another invocation at the same time.
 *
 * @return true when a result record was emitted, false for a setup error
 * @throw internal_error when the harness failed after the subject was
 * launched, the subject's process group is killed before
 */
bool run_invocation(const invocation_spec &spec, result_sink &sink);

/**
 * @brief Decides the outcome from the wait status of the leader.
 * @param status wait status as returned by wait4
 * @param deadline_fired whether the deadline enforcer fired
 * @param oom_killed whether the memory cgroup reported an OOM kill
 * @param cpu_used user plus system time of the leader
 */
termination_outcome classify_outcome(int status, bool deadline_fired, bool oom_killed,
                                     const resource_plan &plan, std::chrono::nanoseconds cpu_used);

}  // namespace testbox
