#include "primus/text/print.h"

#include <cerrno>
#include <system_error>

namespace primus
{
    namespace
    {
        [[noreturn]] void throw_system_error_from_errno()
        {
            throw std::system_error(std::make_error_code(static_cast<std::errc>(errno)));
        }
    } // namespace

    void print_nonformatted(std::FILE* file, const std::string_view text)
    {
        if (text.empty())
            return;
        if (std::fwrite(text.data(), 1, text.size(), file) != text.size()) [[unlikely]]
            throw_system_error_from_errno();
    }
} // namespace primus
