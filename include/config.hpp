#pragma once

#include <chrono>
#include <cstddef>

namespace testbox {

/**
 * @brief Exit codes of the testbox executable
 */
enum error_codes {
    /**
     * @brief A result record was emitted, whatever the subject did
     */
    E_SUCCESS = 0,

    /**
     * @brief Command line could not be parsed
     */
    E_USAGE = 1,

    /**
     * @brief A setup-error record was emitted, the subject never ran
     */
    E_SETUP_ERROR = 2,

    E_INTERNAL_ERROR = 3
};

/**
 * @brief Time between the graceful and the forced termination request
 * once the deadline has passed. Can be overridden by TESTBOX_GRACE_WINDOW
 * (seconds) or --grace.
 */
extern std::chrono::milliseconds GRACE_WINDOW;

/**
 * @brief How long the output collector keeps draining the pipes after
 * termination has been finalized. Only matters when a process outside
 * the subject's process group still holds the write end.
 */
extern std::chrono::milliseconds DRAIN_TIMEOUT;

/**
 * @brief Default retained size in bytes of each captured stream.
 */
extern std::size_t STREAM_SIZE;

/**
 * @brief Regular files larger than this are compared by metadata only.
 */
extern std::size_t DIGEST_SIZE_LIMIT;

/**
 * @brief Reads the TESTBOX_* environment variables into the defaults above.
 * @throw std::invalid_argument when a variable is malformed
 */
void load_config_from_env();

}  // namespace testbox
