#include "common/defer.hpp"
#include <glog/logging.h>
#include <exception>

namespace testbox {

scoped_guard::scoped_guard() : f() {}
scoped_guard::scoped_guard(const std::function<void()> &f) : f(f) {}
scoped_guard::scoped_guard(scoped_guard &&other) noexcept : f(std::move(other.f)) {
    other.f = nullptr;
}

scoped_guard::~scoped_guard() {
    if (!f) return;
    try {
        f();
    } catch (const std::exception &e) {
        // destructors may run during unwinding, never let the cleanup escape
        LOG(ERROR) << "cleanup failed: " << e.what();
    }
}

scoped_guard scoped_guard::operator+(const std::function<void()> &f) const {
    return scoped_guard(f);
}

}  // namespace testbox
