#pragma once

#include <cstddef>

#ifdef NDEBUG

    #define PRIMUS_ASSERT(expr, msg) ((void)0)

#else

namespace primus::detail
{
    [[noreturn]] void assertion_failure(const char* expr, const char* msg, const char* file, std::size_t line);
} // namespace primus::detail

    #define PRIMUS_ASSERT(expr, msg)                                                                                   \
        (void)(!!(expr) || (::primus::detail::assertion_failure(#expr, msg, __FILE__, __LINE__), 0))

#endif
