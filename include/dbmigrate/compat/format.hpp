/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Provides a unified formatting entry point for compilers whose standard
 * library does not ship <format> yet. Detection relies on the
 * __cpp_lib_format feature test macro.
 *
 * Usage:
 *   #include <dbmigrate/compat/format.hpp>
 *   auto s = dbmigrate::compat::format("Migration [{}] failed", name);
 */

#pragma once

#include <version>  // For feature test macros

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define DBMIGRATE_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    // Apple Clang 15+ with libc++ supports std::format
    #define DBMIGRATE_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define DBMIGRATE_HAS_STD_FORMAT 1
#else
    #define DBMIGRATE_HAS_STD_FORMAT 0
#endif

#if DBMIGRATE_HAS_STD_FORMAT
    #include <format>
    namespace dbmigrate::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    // Use fmt library as fallback
    #include <fmt/format.h>
    namespace dbmigrate::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
