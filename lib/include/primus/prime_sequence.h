#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

#include "assertion.h"
#include "macros.h"

namespace primus
{
    template <typename T>
    concept prime_value = std::unsigned_integral<T> && !std::same_as<T, bool>;

    /// Thrown when a prime sequence has no further prime representable in its value type.
    class sequence_exhausted : public std::overflow_error
    {
    public:
        sequence_exhausted(): std::overflow_error("prime sequence exhausted the range of its value type") {}
    };

    namespace detail
    {
        void log_exhausted(std::uintmax_t largest_known, std::size_t known_count);
        [[noreturn]] void throw_exhausted(std::size_t known_count);
    } // namespace detail

    /**
     * \brief Incremental generator of primes in increasing order.
     * \details Every prime found is kept, and each new odd candidate is checked
     * by trial division against the kept primes up to its square root. The
     * sequence never wraps around: once the next candidate would not fit in
     * \p UInt the sequence is exhausted, and stays so.
     * \tparam UInt Unsigned integer type of the produced values.
     */
    template <prime_value UInt>
    class basic_prime_sequence
    {
    public:
        using value_type = UInt;

        /// Single-pass iterator. A value is taken from the sequence only when the
        /// iterator is dereferenced, compared or incremented, so bounded views such
        /// as std::views::take consume exactly the values they yield.
        class iterator
        {
        public:
            using value_type = UInt;
            using difference_type = std::ptrdiff_t;

            iterator() = default;
            explicit iterator(basic_prime_sequence& seq) noexcept: seq_(&seq) {}

            PRIMUS_NON_COPYABLE_TYPE(iterator);
            PRIMUS_DEFAULT_MOVE_MEMBERS(iterator);

            value_type operator*() const
            {
                fetch();
                return *current_;
            }

            iterator& operator++()
            {
                fetch();
                stale_ = true;
                return *this;
            }

            void operator++(int) { ++*this; }

            bool operator==(std::default_sentinel_t) const
            {
                fetch();
                return !current_.has_value();
            }

        private:
            basic_prime_sequence* seq_ = nullptr;
            mutable std::optional<value_type> current_;
            mutable bool stale_ = true;

            void fetch() const
            {
                if (!stale_ || !seq_)
                    return;
                current_ = seq_->try_next();
                stale_ = false;
            }
        };

        basic_prime_sequence() { known_primes_.push_back(2); }

        /// Produces the next prime, or an empty optional once the value type is exhausted.
        std::optional<value_type> try_next()
        {
            if (produced_ == known_primes_.size() && !grow())
                return std::nullopt;
            return known_primes_[produced_++];
        }

        /// Produces the next prime.
        /// \throws sequence_exhausted if no further prime fits in the value type.
        value_type next()
        {
            if (const auto value = try_next())
                return *value;
            detail::throw_exhausted(known_primes_.size());
        }

        /// Discards the next \p count primes. Returns false if the sequence ran out on the way,
        /// in which case everything up to the exhaustion point has been consumed.
        [[nodiscard]] bool try_skip(std::size_t count)
        {
            for (; count > 0; count--)
                if (!try_next())
                    return false;
            return true;
        }

        /// Discards the next \p count primes.
        /// \throws sequence_exhausted if no further prime fits in the value type.
        void skip(const std::size_t count)
        {
            if (!try_skip(count))
                detail::throw_exhausted(known_primes_.size());
        }

        /**
         * \brief Gets the n-th prime, counting from 1.
         * \details Primes already known are looked up directly. Otherwise the record
         * is extended up to the n-th prime. Nothing is consumed either way.
         * \throws std::invalid_argument if \p n is zero.
         * \throws sequence_exhausted if the n-th prime does not fit in the value type.
         */
        value_type nth(const std::size_t n)
        {
            if (n == 0)
                throw std::invalid_argument("prime ordinals start at 1");
            while (known_primes_.size() < n)
                if (!grow())
                    detail::throw_exhausted(known_primes_.size());
            return known_primes_[n - 1];
        }

        iterator begin() { return iterator(*this); }
        std::default_sentinel_t end() const noexcept { return {}; }

        std::span<const value_type> known_primes() const noexcept { return known_primes_; }
        std::size_t produced() const noexcept { return produced_; }
        value_type largest_known() const noexcept { return known_primes_.back(); }

        /// True when every prime found has been produced and no candidate is left in the value type.
        bool exhausted() const noexcept { return produced_ == known_primes_.size() && !next_candidate_; }

    private:
        static constexpr value_type max_value = std::numeric_limits<value_type>::max();

        std::vector<value_type> known_primes_;
        std::optional<value_type> next_candidate_ = value_type(3); // empty once past the range of value_type
        std::size_t produced_ = 0;

        // Appends the next prime to the record
        bool grow()
        {
            if (!next_candidate_)
                return false;
            while (next_candidate_)
            {
                const value_type candidate = *next_candidate_;
                PRIMUS_ASSERT(candidate % 2 == 1, "candidates must be odd");
                PRIMUS_ASSERT(candidate > known_primes_.back(), "candidates must exceed every known prime");
                next_candidate_ = successor(candidate);
                if (!has_known_divisor(candidate))
                {
                    known_primes_.push_back(candidate);
                    return true;
                }
            }
            detail::log_exhausted(known_primes_.back(), known_primes_.size());
            return false;
        }

        static std::optional<value_type> successor(const value_type candidate) noexcept
        {
            if (candidate > max_value - 2)
                return std::nullopt;
            return static_cast<value_type>(candidate + 2);
        }

        bool has_known_divisor(const value_type candidate) const noexcept
        {
            // Candidates are odd, so the leading 2 is never a divisor
            for (std::size_t i = 1; i < known_primes_.size(); i++)
            {
                const value_type prime = known_primes_[i];
                if (prime > candidate / prime) // prime * prime > candidate, without overflowing
                    return false;
                if (candidate % prime == 0)
                    return true;
            }
            return false;
        }
    };

    using prime_sequence = basic_prime_sequence<std::uint64_t>;

    extern template class basic_prime_sequence<std::uint64_t>;

    /// Computes the n-th prime (counting from 1) with a fresh sequence.
    std::uint64_t nth_prime(std::size_t n);
} // namespace primus
