#include <cstddef>
#include <exception>
#include <limits>
#include <ranges>

#include <primus/log.h>
#include <primus/parse.h>
#include <primus/prime_sequence.h>

int main(const int argc, const char* const* argv)
{
    primus::log::configure_from_env();

    std::size_t count = 100;
    if (argc > 1)
    {
        const auto parsed = primus::parse_bounded<std::size_t>(
            argv[1], 0, static_cast<std::size_t>(std::numeric_limits<std::ptrdiff_t>::max()));
        if (!parsed)
        {
            primus::log::error("expected a count, got \"", argv[1], "\"");
            return 2;
        }
        count = *parsed;
    }

    try
    {
        primus::prime_sequence primes;
        for (const auto prime : primes | std::views::take(static_cast<std::ptrdiff_t>(count)))
            primus::println(prime);
    }
    catch (const std::exception& exc)
    {
        primus::log::error(exc.what());
        return 1;
    }
}
