#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = testbox::scoped_guard() + [&]

namespace testbox {

/**
 * @brief Runs the stored callback when leaving the scope.
 * Failures of the callback are logged, never thrown.
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard &operator=(const scoped_guard &) = delete;

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace testbox
