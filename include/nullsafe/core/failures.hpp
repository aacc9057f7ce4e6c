#pragma once
#include <stdexcept>
#include <string>
#include <string_view>
namespace nullsafe {
enum class FailureType {
    IllegalArgument,
    IllegalState,
    NullReference,
    Construction
};
[[nodiscard]] std::string_view FailureTypeName(FailureType type) noexcept;
class NullsafeError : public std::runtime_error {
public:
    NullsafeError(FailureType type, const std::string& message);
    [[nodiscard]] FailureType Type() const noexcept { return type_; }
private:
    FailureType type_;
};
class IllegalArgumentError : public NullsafeError {
public:
    IllegalArgumentError();
    explicit IllegalArgumentError(const std::string& message);
};
class IllegalStateError : public NullsafeError {
public:
    IllegalStateError();
    explicit IllegalStateError(const std::string& message);
};
class NullReferenceError : public NullsafeError {
public:
    NullReferenceError();
    explicit NullReferenceError(const std::string& message);
};
/**
 * @brief Raised when an error requested through a deferred error factory
 * could not itself be constructed.
 *
 * The exception thrown by the failing constructor is nested inside and can
 * be recovered with std::rethrow_if_nested.
 */
class ConstructionFailure : public NullsafeError {
public:
    ConstructionFailure();
    explicit ConstructionFailure(const std::string& message);
};
}
