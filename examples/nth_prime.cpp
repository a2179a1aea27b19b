#include <cstdint>
#include <exception>
#include <limits>

#include <primus/chrono_utils.h>
#include <primus/log.h>
#include <primus/parse.h>
#include <primus/prime_sequence.h>

int main(const int argc, const char* const* argv)
{
    primus::log::configure_from_env();
    if (argc > 2)
    {
        primus::println(stderr, "usage: ", argv[0], " [N]");
        return 2;
    }

    std::size_t n = 1'000'000;
    if (argc == 2)
    {
        const auto parsed = primus::parse_bounded<std::size_t>(argv[1], 1, std::numeric_limits<std::size_t>::max());
        if (!parsed)
        {
            primus::log::error("expected a positive integer, got \"", argv[1], "\"");
            return 2;
        }
        n = *parsed;
    }

    try
    {
        primus::prime_sequence primes;
        std::uint64_t result = 0;
        const auto elapsed = primus::timeit(
            [&]
            {
                primes.skip(n - 1);
                result = primes.next();
            });
        primus::println("prime #", n, " is ", result);
        primus::println("computed in ", primus::to_milliseconds(elapsed), " ms");
        primus::log::debug(primes.known_primes().size(), " primes kept in the record");
    }
    catch (const std::exception& exc)
    {
        primus::log::error(exc.what());
        return 1;
    }
}
