/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Detection is based on the __cpp_lib_format feature test macro. Toolchains
 * without std::format (libstdc++ before GCC 13) fall back to the fmt library.
 *
 * Usage:
 *   #include <sgkdoc/compat/format.hpp>
 *   auto s = sgkdoc::compat::format("run {} finished", run_id);
 */

#pragma once

#include <version>

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define SGKDOC_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define SGKDOC_HAS_STD_FORMAT 1
#else
    #define SGKDOC_HAS_STD_FORMAT 0
#endif

#if SGKDOC_HAS_STD_FORMAT
    #include <format>
    namespace sgkdoc::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace sgkdoc::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
