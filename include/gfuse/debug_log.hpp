#pragma once

#include <cstdarg>
#include <cstdio>

namespace gfuse::debug {

// Format and print one debug line to stderr.
inline void debug_output(const char* fmt, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    std::fprintf(stderr, "[gfuse] %s\n", buffer);
    std::fflush(stderr);
}

} // namespace gfuse::debug

// Compiled out unless GFUSE_ENABLE_DEBUG_OUTPUT is defined.
#ifdef GFUSE_ENABLE_DEBUG_OUTPUT
    #define GFUSE_DEBUG_LOG(fmt, ...) ::gfuse::debug::debug_output(fmt, ##__VA_ARGS__)
#else
    #define GFUSE_DEBUG_LOG(fmt, ...) ((void)0)
#endif
