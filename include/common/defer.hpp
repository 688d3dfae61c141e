#pragma once

#include <utility>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)

/**
 * @brief 在离开作用域时执行一段代码，无论是正常返回还是抛出异常
 * @code{.cpp}
 *     auto unit = backend.launch(source);
 *     defer { backend.cleanup(*unit); };
 * @endcode
 */
#define defer auto DEFER_0(_defered_option) = ::runner::scope_guard_builder() + [&]() noexcept

namespace runner {

template <typename F>
struct scope_guard {
    explicit scope_guard(F &&f) : f(std::move(f)), active(true) {}

    scope_guard(scope_guard &&other) : f(std::move(other.f)), active(other.active) {
        other.active = false;
    }

    scope_guard(const scope_guard &) = delete;
    scope_guard &operator=(const scope_guard &) = delete;

    ~scope_guard() {
        if (active) f();
    }

private:
    F f;
    bool active;
};

struct scope_guard_builder {
    template <typename F>
    scope_guard<F> operator+(F &&f) const {
        return scope_guard<F>(std::forward<F>(f));
    }
};

}  // namespace runner
