#pragma once

#include <sys/resource.h>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace testbox {

struct invocation_spec;

/**
 * @brief Which ceiling killed the subject
 */
enum class limit_kind {
    cpu_time,
    memory,
    output_size
};

const char *to_string(limit_kind kind);

struct rlimit_setting {
    int resource;
    rlim_t soft;
    rlim_t hard;
    const char *name;
};

/**
 * @brief Constraints computed for one run, applied to the subject before
 * its first instruction.
 *
 * rlimits cover CPU time, file size, process count, core dumps and stack.
 * Memory is accounted and capped by a dedicated memory cgroup, rlimits
 * on the address space would make allocation fail instead of killing the
 * subject, which cannot be told apart from an ordinary crash.
 */
struct resource_plan {
    std::vector<rlimit_setting> rlimits;

    /**
     * @brief Kernel name of the memory cgroup, empty when no memory ceiling
     */
    std::string cgroup_name;

    int64_t memory_limit = -1;

    std::optional<std::chrono::milliseconds> cpu_limit;

    std::optional<int64_t> output_limit;

    bool uses_cgroup() const;

    const rlimit_setting *find(int resource) const;
};

/**
 * @brief Measurements read back after the run
 */
struct limit_usage {
    /**
     * @brief Peak memory (RAM + swap) in bytes, -1 when not measured
     */
    int64_t memory_bytes = -1;

    /**
     * @brief The kernel OOM killer fired inside the cgroup
     */
    bool oom_killed = false;
};

/**
 * @brief Computes the constraints of an invocation. Does not touch the system.
 */
resource_plan plan_limits(const invocation_spec &spec);

/**
 * @brief Parent side preparation, creates the memory cgroup if needed.
 * @throw setup_error with kind limit_failed or privilege
 */
void prepare_limits(const resource_plan &plan);

/**
 * @brief Child side, called between fork and exec.
 * Sets every rlimit and moves the process into the memory cgroup.
 * @throw std::system_error or cgroup_exception, the launcher reports it
 * as a setup error and the subject never runs unconstrained.
 */
void apply_limits(const resource_plan &plan);

/**
 * @brief Reads peak memory and the OOM state of the cgroup
 */
limit_usage read_limit_usage(const resource_plan &plan);

/**
 * @brief Kills whatever is left in the cgroup and deletes it.
 * Errors are logged, this runs on cleanup paths.
 * @return number of tasks that had to be killed
 */
int release_limits(const resource_plan &plan);

}  // namespace testbox
