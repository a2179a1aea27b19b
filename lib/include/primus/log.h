#pragma once

#include <cstdio>
#include <optional>
#include <string_view>

#include "text/print.h"

namespace primus::log
{
    enum class level
    {
        trace,
        debug,
        info,
        warn,
        error,
        off
    };

    [[nodiscard]] std::string_view to_string(level lvl) noexcept;
    [[nodiscard]] std::optional<level> parse_level(std::string_view name) noexcept;

    /// Messages below the threshold are discarded. Defaults to level::info.
    [[nodiscard]] level threshold() noexcept;
    void set_threshold(level lvl) noexcept;

    /// Reads the threshold from the PRIMUS_LOG_LEVEL environment variable.
    /// Unset leaves the threshold untouched, unknown names reset it to level::info with a warning.
    void configure_from_env();

    /// Log lines go to stderr unless redirected.
    void set_sink(std::FILE* file) noexcept;

    [[nodiscard]] bool enabled(level lvl) noexcept;

    void write(level lvl, std::string_view message);

    template <typename... Args>
    void emit(const level lvl, const Args&... args)
    {
        if (enabled(lvl))
            log::write(lvl, primus::concat(args...));
    }

    // clang-format off
    template <typename... Args> void trace(const Args&... args) { log::emit(level::trace, args...); }
    template <typename... Args> void debug(const Args&... args) { log::emit(level::debug, args...); }
    template <typename... Args> void info(const Args&... args) { log::emit(level::info, args...); }
    template <typename... Args> void warn(const Args&... args) { log::emit(level::warn, args...); }
    template <typename... Args> void error(const Args&... args) { log::emit(level::error, args...); }
    // clang-format on
} // namespace primus::log
