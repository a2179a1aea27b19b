#include "primus/prime_sequence.h"

#include "primus/log.h"

namespace primus
{
    namespace detail
    {
        void log_exhausted(const std::uintmax_t largest_known, const std::size_t known_count)
        {
            log::warn("prime sequence ran out of candidates after ", known_count, " primes, the largest being ",
                largest_known);
        }

        void throw_exhausted(const std::size_t known_count)
        {
            log::debug("no prime beyond the first ", known_count, " fits in the value type");
            throw sequence_exhausted();
        }
    } // namespace detail

    template class basic_prime_sequence<std::uint64_t>;

    std::uint64_t nth_prime(const std::size_t n)
    {
        prime_sequence seq;
        const std::uint64_t result = seq.nth(n);
        log::debug("prime #", n, " is ", result, ", found with ", seq.known_primes().size(), " primes known");
        return result;
    }
} // namespace primus
