#include "common/defer.hpp"
#include <glog/logging.h>
#include <exception>

namespace grader {
using namespace std;

scoped_guard::scoped_guard() : f() {}

scoped_guard::scoped_guard(function<void()> f) : f(move(f)) {}

scoped_guard::scoped_guard(scoped_guard &&other) noexcept : f(move(other.f)) {
    other.f = nullptr;
}

scoped_guard::~scoped_guard() {
    if (!f) return;
    // 析构函数中不能让异常逃逸，否则栈展开过程中会直接 terminate
    try {
        f();
    } catch (std::exception &ex) {
        LOG(ERROR) << "Deferred action failed: " << ex.what();
    }
}

scoped_guard scoped_guard::operator+(function<void()> f) const {
    return scoped_guard(move(f));
}

}  // namespace grader
