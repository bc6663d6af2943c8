#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "invocation.hpp"

using namespace std;
using namespace testbox;
using namespace nlohmann;

static setup_error_kind validation_failure(const invocation_spec &spec) {
    try {
        validate_invocation(spec);
    } catch (setup_error &e) {
        return e.kind();
    }
    ADD_FAILURE() << "invocation was accepted";
    return setup_error_kind::internal;
}

TEST(InvocationTest, ParseFullDocument) {
    invocation_spec spec = parse_invocation(R"({
        "root": "/srv/box",
        "program": "/home/user/a.out",
        "args": ["1", "2"],
        "env": {"PATH": "/bin", "LANG": "C"},
        "work_dir": "/home/user",
        "time_limit": 2.5,
        "grace_window": 0.1,
        "cpu_limit": 2,
        "memory_limit": 268435456,
        "output_limit": 1048576,
        "process_limit": 16,
        "stream_size": 65536,
        "stdin": "input.txt",
        "watch": "/home",
        "user_id": 1000,
        "group_id": 1001
    })"_json);

    EXPECT_EQ(spec.root, "/srv/box");
    EXPECT_EQ(spec.program, "/home/user/a.out");
    EXPECT_EQ(spec.args, (vector<string>{"1", "2"}));
    EXPECT_EQ(spec.env.at("LANG"), "C");
    EXPECT_EQ(spec.time_limit, chrono::milliseconds(2500));
    EXPECT_EQ(spec.grace_window, chrono::milliseconds(100));
    EXPECT_EQ(spec.cpu_limit, optional<chrono::milliseconds>(chrono::seconds(2)));
    EXPECT_EQ(spec.memory_limit, optional<int64_t>(268435456));
    EXPECT_EQ(spec.output_limit, optional<int64_t>(1048576));
    EXPECT_EQ(spec.process_limit, optional<int64_t>(16));
    EXPECT_EQ(spec.stream_size, 65536u);
    EXPECT_EQ(spec.user_id, 1000);
    EXPECT_EQ(spec.group_id, 1001);

    EXPECT_EQ(spec.host_program(), "/srv/box/home/user/a.out");
    EXPECT_EQ(spec.host_work_dir(), "/srv/box/home/user");
    EXPECT_EQ(spec.host_stdin_file(), "/srv/box/home/user/input.txt");
    EXPECT_EQ(spec.observed_dir(), "/home");
    EXPECT_TRUE(spec.uses_chroot());
    EXPECT_NO_THROW(validate_invocation(spec));
}

TEST(InvocationTest, DefaultsApply) {
    invocation_spec spec = parse_invocation(R"({"program": "a.out", "time_limit": 1})"_json);
    EXPECT_EQ(spec.root, "/");
    EXPECT_EQ(spec.work_dir, "/");
    EXPECT_EQ(spec.exec_path(), "/a.out");
    EXPECT_EQ(spec.observed_dir(), "/");
    EXPECT_EQ(spec.grace_window, GRACE_WINDOW);
    EXPECT_EQ(spec.stream_size, STREAM_SIZE);
    EXPECT_FALSE(spec.memory_limit);
    EXPECT_FALSE(spec.uses_chroot());
    EXPECT_TRUE(spec.env.empty());
}

TEST(InvocationTest, MissingRequiredFields) {
    EXPECT_THROW(parse_invocation(R"({"time_limit": 1})"_json), invalid_argument);
    EXPECT_THROW(parse_invocation(R"({"program": "a.out"})"_json), invalid_argument);
    EXPECT_THROW(parse_invocation(R"({"program": "a.out", "time_limit": -1})"_json), invalid_argument);
    EXPECT_THROW(parse_invocation(R"({"program": "a.out", "time_limit": "soon"})"_json), invalid_argument);
}

TEST(InvocationTest, ValidationRejectsBadFields) {
    invocation_spec good;
    good.program = "/bin/true";
    good.time_limit = chrono::seconds(1);
    EXPECT_NO_THROW(validate_invocation(good));

    invocation_spec spec = good;
    spec.time_limit = chrono::milliseconds(0);
    EXPECT_EQ(validation_failure(spec), setup_error_kind::invalid_invocation);

    spec = good;
    spec.root = "relative/root";
    EXPECT_EQ(validation_failure(spec), setup_error_kind::invalid_invocation);

    spec = good;
    spec.memory_limit = 0;
    EXPECT_EQ(validation_failure(spec), setup_error_kind::invalid_invocation);

    spec = good;
    spec.env["BAD=NAME"] = "x";
    EXPECT_EQ(validation_failure(spec), setup_error_kind::invalid_invocation);

    spec = good;
    spec.watch_dir = "../etc";
    EXPECT_EQ(validation_failure(spec), setup_error_kind::invalid_invocation);
}
