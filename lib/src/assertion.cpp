#include "primus/assertion.h"

#include <cstdio>
#include <cstdlib>

#ifndef NDEBUG

namespace primus::detail
{
    void assertion_failure(const char* expr, const char* msg, const char* file, const std::size_t line)
    {
        (void)std::fprintf(stderr, "Assertion %s failed in %s, line %zu: %s\n", expr, file, line, msg);
        std::abort();
    }
} // namespace primus::detail

#endif
