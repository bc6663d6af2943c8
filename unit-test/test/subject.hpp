#pragma once

#include <sys/types.h>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include "invocation.hpp"
#include "result.hpp"

/**
 * @brief Fresh directory under /tmp, removed with everything in it
 */
struct temp_directory {
    temp_directory();
    ~temp_directory();

    temp_directory(const temp_directory &) = delete;
    temp_directory &operator=(const temp_directory &) = delete;

    const std::filesystem::path &path() const;

private:
    std::filesystem::path dir;
};

/**
 * @brief Invocation of /bin/sh -c script in the host root
 */
testbox::invocation_spec shell_invocation(const std::string &script, const std::filesystem::path &work_dir,
                                          std::chrono::milliseconds time_limit = std::chrono::seconds(5));

/**
 * @brief Keeps every record it receives
 */
struct collecting_sink : public testbox::result_sink {
    void accept(testbox::result_record record) override;
    void accept(testbox::setup_error_record record) override;

    int records = 0;
    std::optional<testbox::result_record> result;
    std::optional<testbox::setup_error_record> error;
};

/**
 * @brief Whether pid names a live (not zombie) process
 */
bool process_alive(pid_t pid);

bool running_as_root();
