#pragma once

#include <concepts>
#include <cstdio>
#include <sstream>
#include <string>
#include <string_view>

namespace primus
{
    namespace detail
    {
        template <typename T>
        void append_text(std::ostringstream& stream, const T& value)
        {
            // Single byte integers would otherwise be written as characters
            if constexpr (std::integral<T> && !std::same_as<T, bool> && !std::same_as<T, char> && sizeof(T) == 1)
                stream << static_cast<int>(value);
            else
                stream << value;
        }
    } // namespace detail

    /// Concatenates the textual representation of every argument.
    template <typename... Args>
    std::string concat(const Args&... args)
    {
        std::ostringstream stream;
        (detail::append_text(stream, args), ...);
        return std::move(stream).str();
    }

    /// Writes text to a file verbatim.
    /// \throws std::system_error if the underlying write fails.
    void print_nonformatted(std::FILE* file, std::string_view text);
    inline void print_nonformatted(const std::string_view text) { print_nonformatted(stdout, text); }

    template <typename... Args>
    void print(std::FILE* file, const Args&... args)
    {
        print_nonformatted(file, primus::concat(args...));
    }

    template <typename First, typename... Rest>
        requires(!std::convertible_to<First, std::FILE*>)
    void print(const First& first, const Rest&... rest)
    {
        primus::print(stdout, first, rest...);
    }

    template <typename... Args>
    void println(std::FILE* file, const Args&... args)
    {
        std::string text = primus::concat(args...);
        text.push_back('\n');
        print_nonformatted(file, text);
    }

    template <typename... Args>
        requires(sizeof...(Args) == 0 || (!std::convertible_to<Args, std::FILE*> && ...))
    void println(const Args&... args)
    {
        primus::println(stdout, args...);
    }
} // namespace primus
