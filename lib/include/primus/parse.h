#pragma once

#include <charconv>
#include <concepts>
#include <optional>
#include <string_view>

namespace primus
{
    template <std::integral T>
    constexpr std::optional<T> parse_consume(std::string_view& str, const int base = 10) noexcept
    {
        T value{};
        const char* end = str.data() + str.size();
        const auto [ptr, ec] = std::from_chars(str.data(), end, value, base);
        if (ec != std::errc{}) return std::nullopt;
        str = {ptr, end};
        return value;
    }

    template <std::integral T>
    constexpr std::optional<T> parse(std::string_view str, const int base = 10) noexcept
    {
        const auto result = parse_consume<T>(str, base);
        return str.empty() ? result : std::nullopt;
    }

    /// Parses the whole string as an integer within [min, max].
    template <std::integral T>
    constexpr std::optional<T> parse_bounded(const std::string_view str, const T min, const T max) noexcept
    {
        const auto result = parse<T>(str);
        if (!result || *result < min || *result > max) return std::nullopt;
        return result;
    }
} // namespace primus
