#include "primus/log.h"

#include <array>
#include <atomic>
#include <cstdlib>

namespace primus::log
{
    namespace
    {
        constexpr std::array<std::string_view, 6> level_names{"trace", "debug", "info", "warn", "error", "off"};

        std::atomic<level> current_threshold{level::info};
        std::atomic<std::FILE*> current_sink{nullptr};
    } // namespace

    std::string_view to_string(const level lvl) noexcept
    {
        const auto index = static_cast<std::size_t>(lvl);
        return index < level_names.size() ? level_names[index] : "unknown";
    }

    std::optional<level> parse_level(const std::string_view name) noexcept
    {
        for (std::size_t i = 0; i < level_names.size(); i++)
            if (level_names[i] == name)
                return static_cast<level>(i);
        if (name == "warning")
            return level::warn;
        return std::nullopt;
    }

    level threshold() noexcept { return current_threshold.load(std::memory_order_relaxed); }
    void set_threshold(const level lvl) noexcept { current_threshold.store(lvl, std::memory_order_relaxed); }

    void configure_from_env()
    {
        const char* value = std::getenv("PRIMUS_LOG_LEVEL");
        if (value == nullptr)
            return;
        if (const auto lvl = parse_level(value))
        {
            set_threshold(*lvl);
            return;
        }
        set_threshold(level::info);
        log::warn("unknown log level \"", value, "\" in PRIMUS_LOG_LEVEL, using info");
    }

    void set_sink(std::FILE* file) noexcept { current_sink.store(file, std::memory_order_relaxed); }

    bool enabled(const level lvl) noexcept { return lvl != level::off && lvl >= threshold(); }

    void write(const level lvl, const std::string_view message)
    {
        std::FILE* sink = current_sink.load(std::memory_order_relaxed);
        primus::println(sink ? sink : stderr, "[", to_string(lvl), "] ", message);
    }
} // namespace primus::log
