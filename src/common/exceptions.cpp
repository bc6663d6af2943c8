#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace testbox {
using namespace std;

testbox_exception::testbox_exception()
    : testbox_exception("") {}

testbox_exception::testbox_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *testbox_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const testbox_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

const char *to_string(setup_error_kind kind) {
    switch (kind) {
        case setup_error_kind::invalid_invocation: return "invalid_invocation";
        case setup_error_kind::root_missing: return "root_missing";
        case setup_error_kind::program_missing: return "program_missing";
        case setup_error_kind::not_executable: return "not_executable";
        case setup_error_kind::workdir_missing: return "workdir_missing";
        case setup_error_kind::stdin_missing: return "stdin_missing";
        case setup_error_kind::limit_failed: return "limit_failed";
        case setup_error_kind::privilege: return "privilege";
        case setup_error_kind::launch_failed: return "launch_failed";
        case setup_error_kind::internal: return "internal";
    }
    return "internal";
}

setup_error::setup_error(setup_error_kind kind, const string &message)
    : testbox_exception(message), error_kind(kind) {}

setup_error_kind setup_error::kind() const noexcept {
    return error_kind;
}

internal_error::internal_error()
    : testbox_exception() {}

internal_error::internal_error(const string &message)
    : testbox_exception(message) {}

}  // namespace testbox
