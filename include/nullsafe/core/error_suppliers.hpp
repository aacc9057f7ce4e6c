#pragma once

#include "nullsafe/core/constants.hpp"
#include "nullsafe/core/failures.hpp"
#include "nullsafe/core/format.hpp"
#include "nullsafe/debug/trace_logger.hpp"

#include <exception>
#include <functional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace nullsafe {

/// Zero-argument capability producing a fresh error instance on every call.
template<typename E>
using ErrorSupplier = std::function<E()>;

namespace detail {

/**
 * @brief Constructs E from args, rethrowing any constructor failure as a
 * ConstructionFailure with the original exception nested.
 */
template<typename E, typename... Args>
E ConstructError(Args&&... args) {
    try {
        return E(std::forward<Args>(args)...);
    } catch (const std::exception& ex) {
        debug::LogConstructionFailure(typeid(E).name(), ex.what());
        std::throw_with_nested(ConstructionFailure(
            compat::format("{} ({}): {}", ErrorMessages::CONSTRUCTION_FAILED, typeid(E).name(), ex.what())));
    } catch (...) {
        debug::LogConstructionFailure(typeid(E).name(), "non-standard exception");
        std::throw_with_nested(ConstructionFailure(
            compat::format("{} ({})", ErrorMessages::CONSTRUCTION_FAILED, typeid(E).name())));
    }
}

} // namespace detail

/**
 * @brief Factory methods for deferred error construction
 *
 * Used together with Maybe::OtherwiseThrow so that the error is only built
 * when the value is actually absent:
 *
 * @code
 * auto name = maybe_username.OtherwiseThrow(
 *     ErrorSuppliers::IllegalArgument("missing username"));
 * @endcode
 */
class ErrorSuppliers {
public:
    // ========================================================================
    // Parameterless singletons
    // ========================================================================

    static const ErrorSupplier<IllegalArgumentError>& IllegalArgument();

    static const ErrorSupplier<IllegalStateError>& IllegalState();

    static const ErrorSupplier<NullReferenceError>& NullReference();

    // ========================================================================
    // Message-capturing factories
    // ========================================================================

    /**
     * @param message Passed to the constructor of every produced error.
     *                Captured now, not when the supplier is invoked.
     */
    static ErrorSupplier<IllegalArgumentError> IllegalArgument(std::string message);

    static ErrorSupplier<IllegalStateError> IllegalState(std::string message);

    static ErrorSupplier<NullReferenceError> NullReference(std::string message);

    // ========================================================================
    // Generic factories
    // ========================================================================

    /**
     * @brief Supplier of E built through its default constructor
     *
     * A throwing constructor surfaces as ConstructionFailure.
     */
    template<typename E>
    static ErrorSupplier<E> Exception() {
        static_assert(std::is_default_constructible_v<E>,
                      "Error kind must be default constructible");
        return []() { return detail::ConstructError<E>(); };
    }

    /**
     * @brief Supplier of E built through its single-message constructor
     *
     * A throwing constructor surfaces as ConstructionFailure.
     */
    template<typename E>
    static ErrorSupplier<E> Exception(std::string message) {
        static_assert(std::is_constructible_v<E, const std::string&>,
                      "Error kind must be constructible from a message");
        return [message = std::move(message)]() { return detail::ConstructError<E>(message); };
    }

    ErrorSuppliers() = delete;
};

} // namespace nullsafe
