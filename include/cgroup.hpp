#pragma once

#include <cstdint>
#include <exception>
#include <string>

struct cgroup;
struct cgroup_controller;

namespace testbox {

struct cgroup_exception : public std::exception {
    cgroup_exception(std::string cgroup_op, int err);

    const char *what() const noexcept override;

    static void ensure(std::string cgroup_op, int err);

private:
    std::string errmsg;
};

/**
 * @brief A controller ("memory", "cpuacct", ...) of a cgroup
 */
struct cgroup_ctrl {
    struct cgroup_controller *ctrl;

    void add_value(const std::string &name, int64_t value);

    int64_t get_value_int64(const std::string &name);
};

/**
 * @brief Owns the libcgroup description of a control group.
 * The description is freed on destruction, the kernel side is only
 * touched by create_cgroup, attach_task, kill_tasks and delete_cgroup.
 */
struct cgroup_guard {
    /**
     * @param cgroup_name kernel name of the cgroup, e.g. "/testbox/run_42"
     */
    explicit cgroup_guard(const std::string &cgroup_name);

    ~cgroup_guard();

    cgroup_guard(const cgroup_guard &) = delete;
    cgroup_guard &operator=(const cgroup_guard &) = delete;

    /**
     * @brief Creates the cgroup in the kernel together with the controllers
     * and values added so far.
     */
    void create_cgroup(int ignore_ownership);

    /**
     * @brief Adds a controller to the description
     * @param name name of the controller, e.g. "memory"
     * @throw cgroup_exception when the controller cannot be added
     */
    cgroup_ctrl add_controller(const std::string &name);

    /**
     * @brief Returns a controller added before or read by get_cgroup
     * @throw cgroup_exception when the controller does not exist
     */
    cgroup_ctrl get_controller(const std::string &name);

    /**
     * @brief Reads every controller and value of the cgroup from the kernel
     */
    void get_cgroup();

    /**
     * @brief Moves the calling process into the cgroup
     */
    void attach_task();

    /**
     * @brief Sends SIGKILL to every task of the cgroup
     * @param controller a controller the cgroup is attached to
     * @return number of tasks signalled
     */
    int kill_tasks(const std::string &controller);

    /**
     * @brief Deletes the cgroup from the kernel. Remaining tasks are
     * migrated to the parent group.
     */
    void delete_cgroup();

    const std::string &name() const;

    static void init();

private:
    std::string cgroup_name;
    struct cgroup *cg;
};

}  // namespace testbox
