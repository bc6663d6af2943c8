#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace testbox {

/**
 * @brief Everything needed to run one subject program.
 * Owned by the caller, the core only reads it.
 *
 * Paths named "inside the root" are the paths the subject sees, they are
 * resolved against root on the host.
 */
struct invocation_spec {
    /**
     * @brief The isolated root on the host, already provisioned.
     * "/" means the caller already runs inside the prepared root, so
     * no chroot is performed.
     */
    std::filesystem::path root = "/";

    /**
     * @brief Subject program, inside the root (relative to work_dir when relative)
     */
    std::filesystem::path program;

    /**
     * @brief Arguments passed after argv[0] (which is the program path)
     */
    std::vector<std::string> args;

    /**
     * @brief The complete environment of the subject, nothing is inherited
     */
    std::map<std::string, std::string> env;

    /**
     * @brief Working directory, inside the root
     */
    std::filesystem::path work_dir = "/";

    /**
     * @brief Wall clock limit, the subject is killed once it is reached
     */
    std::chrono::milliseconds time_limit{0};

    /**
     * @brief Time between SIGTERM and SIGKILL after the deadline
     */
    std::chrono::milliseconds grace_window;

    /**
     * @brief Memory ceiling in bytes, enforced by a memory cgroup
     */
    std::optional<int64_t> memory_limit;

    /**
     * @brief Largest file the subject may write, in bytes
     */
    std::optional<int64_t> output_limit;

    std::optional<std::chrono::milliseconds> cpu_limit;

    /**
     * @brief Maximum number of processes of the run user
     */
    std::optional<int64_t> process_limit;

    /**
     * @brief Retained bytes of each of stdout and stderr
     */
    std::size_t stream_size;

    /**
     * @brief File connected to stdin, inside the root. /dev/null when empty.
     */
    std::filesystem::path stdin_file;

    /**
     * @brief Subtree observed for filesystem changes, inside the root.
     * Defaults to the working directory when empty.
     */
    std::filesystem::path watch_dir;

    /**
     * @brief Credentials the subject runs with, -1 keeps the harness' ones
     */
    int user_id = -1;
    int group_id = -1;

    /**
     * @brief Initializes the tunables from the configured defaults
     */
    invocation_spec();

    /**
     * @brief Program path as the subject sees it, relative programs are
     * resolved against the working directory
     */
    std::filesystem::path exec_path() const;

    std::filesystem::path host_program() const;
    std::filesystem::path host_work_dir() const;
    std::filesystem::path host_stdin_file() const;
    std::filesystem::path observed_dir() const;

    bool uses_chroot() const;
};

/**
 * @brief Checks the fields that do not depend on the filesystem
 * @throw setup_error with kind invalid_invocation
 */
void validate_invocation(const invocation_spec &spec);

/**
 * @brief Builds an invocation from its JSON form
 * @code{.json}
 * {
 *   "root": "/srv/box", "program": "/home/user/a.out", "args": ["1"],
 *   "env": {"PATH": "/bin"}, "work_dir": "/home/user", "time_limit": 2.5,
 *   "memory_limit": 268435456, "output_limit": 1048576, "cpu_limit": 2,
 *   "process_limit": 16, "stream_size": 65536, "grace_window": 0.5,
 *   "stdin": "/home/user/input.txt", "watch": "/home/user",
 *   "user_id": 1000, "group_id": 1000
 * }
 * @endcode
 * Durations are in seconds, sizes in bytes.
 * @throw std::invalid_argument when a field is missing or has the wrong type
 */
invocation_spec parse_invocation(const nlohmann::json &j);

}  // namespace testbox
