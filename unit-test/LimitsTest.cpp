#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "invocation.hpp"
#include "limits.hpp"
#include "test/subject.hpp"

using namespace std;
using namespace testbox;

TEST(LimitsTest, PlanWithoutCeilings) {
    invocation_spec spec = shell_invocation("true", "/");
    resource_plan plan = plan_limits(spec);

    EXPECT_FALSE(plan.uses_cgroup());
    EXPECT_EQ(plan.find(RLIMIT_CPU), nullptr);
    EXPECT_EQ(plan.find(RLIMIT_FSIZE), nullptr);
    EXPECT_EQ(plan.find(RLIMIT_NPROC), nullptr);

    const rlimit_setting *core = plan.find(RLIMIT_CORE);
    ASSERT_NE(core, nullptr);
    EXPECT_EQ(core->soft, 0u);
    EXPECT_EQ(core->hard, 0u);
}

TEST(LimitsTest, CpuLimitRoundsUpAndLeavesOneSecondToTheHardLimit) {
    invocation_spec spec = shell_invocation("true", "/");
    spec.cpu_limit = chrono::milliseconds(1500);
    resource_plan plan = plan_limits(spec);

    const rlimit_setting *cpu = plan.find(RLIMIT_CPU);
    ASSERT_NE(cpu, nullptr);
    EXPECT_EQ(cpu->soft, 2u);
    EXPECT_EQ(cpu->hard, 3u);
}

TEST(LimitsTest, OutputAndProcessCeilings) {
    invocation_spec spec = shell_invocation("true", "/");
    spec.output_limit = 4096;
    spec.process_limit = 8;
    resource_plan plan = plan_limits(spec);

    const rlimit_setting *fsize = plan.find(RLIMIT_FSIZE);
    ASSERT_NE(fsize, nullptr);
    EXPECT_EQ(fsize->soft, 4096u);
    EXPECT_EQ(fsize->hard, 4096u);
    EXPECT_EQ(plan.output_limit, optional<int64_t>(4096));

    const rlimit_setting *nproc = plan.find(RLIMIT_NPROC);
    ASSERT_NE(nproc, nullptr);
    EXPECT_EQ(nproc->soft, 8u);
}

TEST(LimitsTest, MemoryCeilingUsesDistinctCgroups) {
    invocation_spec spec = shell_invocation("true", "/");
    spec.memory_limit = 64 << 20;
    resource_plan first = plan_limits(spec), second = plan_limits(spec);

    EXPECT_TRUE(first.uses_cgroup());
    EXPECT_EQ(first.memory_limit, 64 << 20);
    EXPECT_NE(first.cgroup_name, second.cgroup_name);
    EXPECT_EQ(first.cgroup_name.rfind("/testbox/", 0), 0u);
}

TEST(LimitsTest, ApplyLimitsInChild) {
    invocation_spec spec = shell_invocation("true", "/");
    spec.output_limit = 1024;
    resource_plan plan = plan_limits(spec);

    pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        try {
            apply_limits(plan);
        } catch (exception &) {
            _exit(2);
        }
        struct rlimit lim;
        getrlimit(RLIMIT_FSIZE, &lim);
        _exit(lim.rlim_cur == 1024 ? 0 : 1);
    }

    int status;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}

TEST(LimitsTest, PrepareWithoutPrivilegeIsASetupError) {
    if (running_as_root()) GTEST_SKIP() << "root can create cgroups";

    invocation_spec spec = shell_invocation("true", "/");
    spec.memory_limit = 64 << 20;
    resource_plan plan = plan_limits(spec);
    try {
        prepare_limits(plan);
        release_limits(plan);
        GTEST_SKIP() << "cgroup hierarchy is writable without root";
    } catch (setup_error &e) {
        EXPECT_EQ(e.kind(), setup_error_kind::privilege);
    }
}

TEST(LimitsTest, ReleaseWithoutCgroupIsANoop) {
    resource_plan plan = plan_limits(shell_invocation("true", "/"));
    EXPECT_NO_THROW(prepare_limits(plan));
    limit_usage usage = read_limit_usage(plan);
    EXPECT_EQ(usage.memory_bytes, -1);
    EXPECT_FALSE(usage.oom_killed);
    EXPECT_EQ(release_limits(plan), 0);
}
