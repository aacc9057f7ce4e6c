#pragma once
#include <cstddef>
#include <string_view>
namespace nullsafe {
struct MaybeConstants {
    static constexpr size_t UNKNOWN_HASH = 0;
    static constexpr size_t KNOWN_ELEMENT_COUNT = 1;
    static constexpr size_t UNKNOWN_ELEMENT_COUNT = 0;
};
struct DisplayConstants {
    static constexpr std::string_view DESCRIPTIVE_UNKNOWN = "unknown";
    static constexpr std::string_view DESCRIPTIVE_KNOWN_PREFIX = "definitely ";
    static constexpr std::string_view DESCRIPTIVE_KNOWN_SUFFIX = "";
    static constexpr std::string_view TERSE_UNKNOWN = "none";
    static constexpr std::string_view TERSE_KNOWN_PREFIX = "some(";
    static constexpr std::string_view TERSE_KNOWN_SUFFIX = ")";
};
struct ErrorMessages {
    static constexpr std::string_view ILLEGAL_ARGUMENT = "Illegal argument";
    static constexpr std::string_view ILLEGAL_STATE = "Illegal state";
    static constexpr std::string_view NULL_REFERENCE = "Null reference";
    static constexpr std::string_view CONSTRUCTION_FAILED = "Failed to construct the requested error";
    static constexpr std::string_view UNWRAP_ON_ERR = "Called Unwrap() on an Err Result";
    static constexpr std::string_view UNWRAP_ERR_ON_OK = "Called UnwrapErr() on an Ok Result";
};
}
