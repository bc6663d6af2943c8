#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace testbox {

struct testbox_exception : std::exception {
    testbox_exception();
    explicit testbox_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const testbox_exception &ex);

    template <typename T>
    testbox_exception operator<<(const T &t) const {
        return testbox_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

protected:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief Reasons why the harness could not run the subject.
 * None of these is caused by the subject program itself.
 */
enum class setup_error_kind {
    invalid_invocation,
    root_missing,
    program_missing,
    not_executable,
    workdir_missing,
    stdin_missing,
    limit_failed,
    privilege,
    launch_failed,
    internal
};

const char *to_string(setup_error_kind kind);

/**
 * @brief The invocation was aborted before (or while) launching the subject.
 * Reported to the caller as a setup-error record, never as a subject outcome.
 */
struct setup_error : public testbox_exception {
    setup_error(setup_error_kind kind, const std::string &message);

    setup_error_kind kind() const noexcept;

private:
    setup_error_kind error_kind;
};

/**
 * @brief Failure of the harness itself after the subject was launched.
 */
struct internal_error : public testbox_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

}  // namespace testbox
