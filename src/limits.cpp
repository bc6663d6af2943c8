#include "limits.hpp"
#include <errno.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <unistd.h>
#include <atomic>
#include <cmath>
#include <ctime>
#include <fstream>
#include <system_error>
#include "cgroup.hpp"
#include "common/exceptions.hpp"
#include "invocation.hpp"

namespace testbox {
using namespace std;

const char *to_string(limit_kind kind) {
    switch (kind) {
        case limit_kind::cpu_time: return "cpu_time";
        case limit_kind::memory: return "memory";
        case limit_kind::output_size: return "output_size";
    }
    return "unknown";
}

bool resource_plan::uses_cgroup() const {
    return !cgroup_name.empty();
}

const rlimit_setting *resource_plan::find(int resource) const {
    for (auto &setting : rlimits)
        if (setting.resource == resource) return &setting;
    return nullptr;
}

static string next_cgroup_name() {
    static atomic<int> counter{0};
    return fmt::format("/testbox/run_{}_{}_{}", getpid(), (long)time(nullptr), counter++);
}

resource_plan plan_limits(const invocation_spec &spec) {
    resource_plan plan;

    if (spec.cpu_limit) {
        // At the soft limit the kernel sends SIGXCPU, which is a reliable way
        // to detect the CPU limit, one second later a SIGKILL.
        rlim_t seconds = (rlim_t)ceil(spec.cpu_limit->count() / 1000.0);
        plan.rlimits.push_back({RLIMIT_CPU, seconds, seconds + 1, "RLIMIT_CPU"});
        plan.cpu_limit = spec.cpu_limit;
    }

    if (spec.output_limit) {
        rlim_t bytes = (rlim_t)*spec.output_limit;
        plan.rlimits.push_back({RLIMIT_FSIZE, bytes, bytes, "RLIMIT_FSIZE"});
        plan.output_limit = spec.output_limit;
    }

    if (spec.process_limit) {
        rlim_t procs = (rlim_t)*spec.process_limit;
        plan.rlimits.push_back({RLIMIT_NPROC, procs, procs, "RLIMIT_NPROC"});
    }

    // a crashing subject must not drop core files into the observed tree
    plan.rlimits.push_back({RLIMIT_CORE, 0, 0, "RLIMIT_CORE"});
    // raise the stack up to what the harness itself is allowed
    struct rlimit stack;
    if (getrlimit(RLIMIT_STACK, &stack) == 0)
        plan.rlimits.push_back({RLIMIT_STACK, stack.rlim_max, stack.rlim_max, "RLIMIT_STACK"});

    if (spec.memory_limit) {
        plan.memory_limit = *spec.memory_limit;
        plan.cgroup_name = next_cgroup_name();
    }

    return plan;
}

void prepare_limits(const resource_plan &plan) {
    if (!plan.uses_cgroup()) return;

    try {
        cgroup_guard::init();

        cgroup_guard cg(plan.cgroup_name);
        cgroup_ctrl ctrl = cg.add_controller("memory");

        // equal RAM and RAM+swap limits so that the subject never swaps
        ctrl.add_value("memory.limit_in_bytes", plan.memory_limit);
        ctrl.add_value("memory.memsw.limit_in_bytes", plan.memory_limit);

        cg.create_cgroup(1);
    } catch (cgroup_exception &e) {
        setup_error_kind kind = geteuid() == 0 ? setup_error_kind::limit_failed : setup_error_kind::privilege;
        throw setup_error(kind, fmt::format("unable to create memory cgroup {}: {}", plan.cgroup_name, e.what()));
    }

    LOG(INFO) << "created cgroup " << plan.cgroup_name << " with memory limit " << plan.memory_limit << " bytes";
}

void apply_limits(const resource_plan &plan) {
    for (auto &setting : plan.rlimits) {
        struct rlimit lim;
        lim.rlim_cur = setting.soft;
        lim.rlim_max = setting.hard;
        if (setrlimit(setting.resource, &lim) != 0)
            throw system_error(errno, system_category(), fmt::format("setrlimit {}", setting.name));
    }

    if (plan.uses_cgroup()) {
        cgroup_guard cg(plan.cgroup_name);
        cg.get_cgroup();
        cg.attach_task();
    }
}

limit_usage read_limit_usage(const resource_plan &plan) {
    limit_usage usage;
    if (!plan.uses_cgroup()) return usage;

    try {
        cgroup_guard cg(plan.cgroup_name);
        cg.get_cgroup();
        cgroup_ctrl ctrl = cg.get_controller("memory");
        usage.memory_bytes = ctrl.get_value_int64("memory.memsw.max_usage_in_bytes");
    } catch (cgroup_exception &e) {
        LOG(WARNING) << "unable to read memory usage of " << plan.cgroup_name << ": " << e.what();
    }

    ifstream fin("/sys/fs/cgroup/memory" + plan.cgroup_name + "/memory.oom_control");
    while (fin.good()) {
        string token;
        fin >> token;
        if (token == "oom_kill") {
            int64_t count = 0;
            fin >> count;
            usage.oom_killed = count > 0;
        }
    }

    LOG(INFO) << "total memory used: " << usage.memory_bytes / 1024 << "kB"
              << (usage.oom_killed ? ", oom killer fired" : "");
    return usage;
}

int release_limits(const resource_plan &plan) {
    if (!plan.uses_cgroup()) return 0;

    int killed = 0;
    try {
        cgroup_guard cg(plan.cgroup_name);
        killed = cg.kill_tasks("memory");
    } catch (cgroup_exception &e) {
        LOG(ERROR) << "unable to kill tasks of " << plan.cgroup_name << ": " << e.what();
    }

    try {
        cgroup_guard cg(plan.cgroup_name);
        cg.add_controller("memory");
        cg.delete_cgroup();
    } catch (cgroup_exception &e) {
        LOG(ERROR) << "unable to delete " << plan.cgroup_name << ": " << e.what();
    }

    if (killed > 0)
        LOG(WARNING) << killed << " task(s) left in " << plan.cgroup_name << " killed";
    return killed;
}

}  // namespace testbox
