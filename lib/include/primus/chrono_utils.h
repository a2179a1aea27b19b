#pragma once

#include <chrono>
#include <concepts>
#include <functional>

namespace primus
{
    template <typename Func, typename... Args>
        requires std::invocable<Func, Args...>
    auto timeit(Func&& func, Args&&... args)
    {
        const auto start = std::chrono::high_resolution_clock::now();
        (void)std::invoke(static_cast<Func&&>(func), static_cast<Args&&>(args)...);
        const auto end = std::chrono::high_resolution_clock::now();
        return end - start;
    }

    template <typename Rep, typename Period>
    constexpr double to_milliseconds(const std::chrono::duration<Rep, Period> duration) noexcept
    {
        return std::chrono::duration<double, std::milli>(duration).count();
    }
} // namespace primus
