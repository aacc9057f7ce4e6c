#pragma once

/**
 * @file trace_logger.hpp
 * @brief Diagnostic tracing for the fail-fast paths of Maybe and the
 * deferred error factories.
 *
 * Output goes to stdout. Tracing is compiled out unless NULLSAFE_DEBUG_TRACE
 * is defined.
 *
 * Enable via CMake: -DNULLSAFE_DEBUG_TRACE=ON
 */

#include <string_view>

#ifdef NULLSAFE_DEBUG_TRACE

#include <cstdio>
#include <fmt/format.h>

namespace nullsafe::debug {

// ============================================================================
// Core logging macros
// ============================================================================

#define NULLSAFE_TRACE(operation, message) \
    do { \
        ::fmt::print(stdout, "[NULLSAFE-DEBUG] {} {}\n", operation, message); \
        std::fflush(stdout); \
    } while(0)

#define NULLSAFE_TRACE_VALUE(operation, name, value) \
    do { \
        ::fmt::print(stdout, "[NULLSAFE-DEBUG] {} {}: {}\n", operation, name, value); \
        std::fflush(stdout); \
    } while(0)

// ============================================================================
// Events
// ============================================================================

inline void LogAbsentValueFailure(std::string_view error_kind) {
    NULLSAFE_TRACE_VALUE("OTHERWISE_THROW", "absent value, raising", error_kind);
}

inline void LogAbsentValueErr() {
    NULLSAFE_TRACE("OTHERWISE_ERR", "absent value, returning Err");
}

inline void LogConstructionFailure(std::string_view error_kind, std::string_view cause) {
    NULLSAFE_TRACE_VALUE("SUPPLIER", "failed to construct", error_kind);
    NULLSAFE_TRACE_VALUE("SUPPLIER", "cause", cause);
}

} // namespace nullsafe::debug

#else // !NULLSAFE_DEBUG_TRACE

#define NULLSAFE_TRACE(operation, message) ((void)0)
#define NULLSAFE_TRACE_VALUE(operation, name, value) ((void)0)

namespace nullsafe::debug {

inline void LogAbsentValueFailure(std::string_view) {}
inline void LogAbsentValueErr() {}
inline void LogConstructionFailure(std::string_view, std::string_view) {}

} // namespace nullsafe::debug

#endif // NULLSAFE_DEBUG_TRACE
