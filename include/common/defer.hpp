#pragma once

#include <functional>

#define GRADER_DEFER_1(x, y) x##y
#define GRADER_DEFER_2(x, y) GRADER_DEFER_1(x, y)
#define GRADER_DEFER_0(x) GRADER_DEFER_2(x, __COUNTER__)

/**
 * @brief 在当前作用域退出时执行一段代码
 * @code{.cpp}
 *     defer { remove_all(workspace); };
 * @endcode
 * 无论是正常返回还是抛出异常，花括号内的代码都会被执行。
 */
#define defer auto GRADER_DEFER_0(_deferred_action) = grader::scoped_guard() + [&]()

namespace grader {

struct scoped_guard {
    scoped_guard();
    explicit scoped_guard(std::function<void()> f);
    scoped_guard(scoped_guard &&other) noexcept;
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard &operator=(const scoped_guard &) = delete;

    scoped_guard operator+(std::function<void()> f) const;

private:
    std::function<void()> f;
};

}  // namespace grader
