#ifdef __unix__
#include "stdio.h" // NOLINT for fileno
#include <cstdio>
#include <unistd.h>
#endif

#include "titlecase/util/tty.hpp"

namespace titlecase {

bool is_tty(std::FILE* file) noexcept
{
#ifdef __unix__
    return isatty(fileno(file));
#else
    return false;
#endif
}

const bool is_stderr_tty = is_tty(stderr);

} // namespace titlecase
