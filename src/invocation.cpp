#include "invocation.hpp"
#include <fmt/core.h>
#include <cmath>
#include <stdexcept>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "config.hpp"

namespace testbox {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

invocation_spec::invocation_spec()
    : grace_window(GRACE_WINDOW), stream_size(STREAM_SIZE) {}

fs::path invocation_spec::exec_path() const {
    return program.is_absolute() ? program : work_dir / program;
}

fs::path invocation_spec::host_program() const {
    return path_in_root(root, exec_path());
}

fs::path invocation_spec::host_work_dir() const {
    return path_in_root(root, work_dir);
}

fs::path invocation_spec::host_stdin_file() const {
    return path_in_root(root, stdin_file.is_absolute() ? stdin_file : work_dir / stdin_file);
}

fs::path invocation_spec::observed_dir() const {
    return watch_dir.empty() ? work_dir : watch_dir;
}

bool invocation_spec::uses_chroot() const {
    return fs::path(root).lexically_normal() != "/";
}

void validate_invocation(const invocation_spec &spec) {
    auto fail = [](const string &message) {
        throw setup_error(setup_error_kind::invalid_invocation, message);
    };

    if (spec.root.empty() || !spec.root.is_absolute())
        fail("root should be an absolute path");
    if (spec.program.empty())
        fail("program is required");
    if (!spec.work_dir.is_absolute())
        fail("work_dir should be an absolute path inside the root");
    if (spec.time_limit <= chrono::milliseconds::zero())
        fail("time_limit should be positive");
    if (spec.grace_window < chrono::milliseconds::zero())
        fail("grace_window should not be negative");
    if (spec.memory_limit && *spec.memory_limit <= 0)
        fail("memory_limit should be positive");
    if (spec.output_limit && *spec.output_limit <= 0)
        fail("output_limit should be positive");
    if (spec.cpu_limit && *spec.cpu_limit <= chrono::milliseconds::zero())
        fail("cpu_limit should be positive");
    if (spec.process_limit && *spec.process_limit <= 0)
        fail("process_limit should be positive");
    for (auto &[key, value] : spec.env) {
        if (key.empty() || key.find('=') != string::npos)
            fail(fmt::format("invalid environment variable name '{}'", key));
    }

    // every path must stay inside the root
    try {
        spec.host_program();
        spec.host_work_dir();
        spec.host_stdin_file();
        path_in_root(spec.root, spec.observed_dir());
    } catch (invalid_argument &e) {
        fail(e.what());
    }
}

static chrono::milliseconds seconds_field(const json &j, const char *key) {
    double seconds = get_value<double>(j, key);
    if (!isfinite(seconds) || seconds < 0)
        throw build_invalid_argument(j, key);
    return chrono::milliseconds((long long)llround(seconds * 1000));
}

invocation_spec parse_invocation(const json &j) {
    invocation_spec spec;
    spec.root = get_value_def<string>(j, "/", "root");
    spec.program = get_value<string>(j, "program");
    spec.args = get_value_def<vector<string>>(j, {}, "args");
    spec.env = get_value_def<map<string, string>>(j, {}, "env");
    spec.work_dir = get_value_def<string>(j, "/", "work_dir");
    spec.time_limit = seconds_field(j, "time_limit");

    if (exists(j, "grace_window")) spec.grace_window = seconds_field(j, "grace_window");
    if (exists(j, "cpu_limit")) spec.cpu_limit = seconds_field(j, "cpu_limit");
    if (exists(j, "memory_limit")) spec.memory_limit = get_value<int64_t>(j, "memory_limit");
    if (exists(j, "output_limit")) spec.output_limit = get_value<int64_t>(j, "output_limit");
    if (exists(j, "process_limit")) spec.process_limit = get_value<int64_t>(j, "process_limit");
    spec.stream_size = get_value_def<size_t>(j, spec.stream_size, "stream_size");
    spec.stdin_file = get_value_def<string>(j, "", "stdin");
    spec.watch_dir = get_value_def<string>(j, "", "watch");
    spec.user_id = get_value_def<int>(j, -1, "user_id");
    spec.group_id = get_value_def<int>(j, -1, "group_id");
    return spec;
}

}  // namespace testbox
