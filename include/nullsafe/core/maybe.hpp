#pragma once

#include "nullsafe/configuration/display_config.hpp"
#include "nullsafe/core/constants.hpp"
#include "nullsafe/core/error_suppliers.hpp"
#include "nullsafe/core/format.hpp"
#include "nullsafe/core/result.hpp"
#include "nullsafe/debug/trace_logger.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace nullsafe {

/**
 * @brief A possibly non-existent value of type T
 *
 * A Maybe is either Known (holds exactly one T) or Unknown (holds nothing).
 * The value cannot be reached without saying what happens when it is absent:
 * substitute a default, fall back to another Maybe, or fail with a
 * caller-supplied error.
 *
 * Instances are only created through the factory methods and expose no
 * mutating operations; every combinator returns a new Maybe.
 *
 * Equality: two Known instances are equal when their values are equal;
 * all Unknown instances of the same T are equal to each other and never
 * equal to a Known one.
 *
 * @example
 * ```cpp
 * auto port = LookupSetting("port")                 // Maybe<std::string>
 *     .Map([](const std::string& s) { return std::stoi(s); })
 *     .Otherwise(8080);
 *
 * auto user = LookupSetting("user")
 *     .OtherwiseThrow(ErrorSuppliers::IllegalArgument("missing user"));
 * ```
 */
template<typename T>
class Maybe {
    static_assert(!std::is_reference_v<T>, "Maybe cannot hold a reference");
    static_assert(!std::is_void_v<T>, "Maybe cannot hold void");

public:
    using value_type = T;
    using const_iterator = const T*;
    using iterator = const_iterator;

    // ========================================================================
    // Construction
    // ========================================================================

    /// Wraps a value known to exist.
    [[nodiscard]] static Maybe Definitely(T value) {
        return Maybe(std::in_place, std::move(value));
    }

    /// The absent instance.
    [[nodiscard]] static Maybe Unknown() noexcept {
        return Maybe();
    }

    /// Synonym of Unknown().
    [[nodiscard]] static Maybe Nothing() noexcept {
        return Unknown();
    }

    /// Unknown when value is null, otherwise Known holding a copy of *value.
    [[nodiscard]] static Maybe Of(const T* value) {
        if (value == nullptr) {
            return Unknown();
        }
        return Definitely(*value);
    }

    [[nodiscard]] static Maybe FromOptional(std::optional<T> value) {
        if (!value.has_value()) {
            return Unknown();
        }
        return Definitely(*std::move(value));
    }

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] bool IsKnown() const noexcept { return value_.has_value(); }

    [[nodiscard]] bool IsEmpty() const noexcept { return !IsKnown(); }

    // ========================================================================
    // Default substitution
    // ========================================================================

    [[nodiscard]] T Otherwise(T default_value) const& {
        if (IsKnown()) {
            return *value_;
        }
        return default_value;
    }

    [[nodiscard]] T Otherwise(T default_value) && {
        if (IsKnown()) {
            return *std::move(value_);
        }
        return default_value;
    }

    /// This instance when Known, otherwise the fallback. Chains fallback sources.
    [[nodiscard]] Maybe Otherwise(Maybe fallback) const& {
        if (IsKnown()) {
            return *this;
        }
        return fallback;
    }

    [[nodiscard]] Maybe Otherwise(Maybe fallback) && {
        if (IsKnown()) {
            return std::move(*this);
        }
        return fallback;
    }

    // ========================================================================
    // Transformation
    // ========================================================================

    /**
     * @brief Applies mapping to the value when Known
     *
     * mapping is never invoked on an Unknown instance, so it may be a
     * partial function that is only valid for present values.
     */
    template<typename F>
    [[nodiscard]] auto Map(F&& mapping) const& -> Maybe<std::decay_t<std::invoke_result_t<F, const T&>>> {
        using U = std::decay_t<std::invoke_result_t<F, const T&>>;
        if (IsEmpty()) {
            return Maybe<U>::Unknown();
        }
        return Maybe<U>::Definitely(std::invoke(std::forward<F>(mapping), *value_));
    }

    template<typename F>
    [[nodiscard]] auto Map(F&& mapping) && -> Maybe<std::decay_t<std::invoke_result_t<F, T&&>>> {
        using U = std::decay_t<std::invoke_result_t<F, T&&>>;
        if (IsEmpty()) {
            return Maybe<U>::Unknown();
        }
        return Maybe<U>::Definitely(std::invoke(std::forward<F>(mapping), *std::move(value_)));
    }

    /// Synonym of Map().
    template<typename F>
    [[nodiscard]] auto To(F&& mapping) const& {
        return Map(std::forward<F>(mapping));
    }

    template<typename F>
    [[nodiscard]] auto To(F&& mapping) && {
        return std::move(*this).Map(std::forward<F>(mapping));
    }

    /// Known(predicate(value)) when Known; Unknown without testing otherwise.
    template<typename Pred>
    [[nodiscard]] Maybe<bool> Query(Pred&& predicate) const {
        if (IsEmpty()) {
            return Maybe<bool>::Unknown();
        }
        return Maybe<bool>::Definitely(
            static_cast<bool>(std::invoke(std::forward<Pred>(predicate), *value_)));
    }

    // ========================================================================
    // Fail-fast extraction
    // ========================================================================

    /**
     * @brief The value when Known, otherwise throws what supplier produces
     *
     * supplier is a zero-argument callable returning an exception object,
     * typically an ErrorSupplier. It is not invoked when the value is Known.
     */
    template<typename Supplier, typename = std::enable_if_t<std::is_invocable_v<Supplier&&>>>
    const T& OtherwiseThrow(Supplier&& supplier) const& {
        if (IsEmpty()) {
            RaiseAbsent(std::forward<Supplier>(supplier));
        }
        return *value_;
    }

    template<typename Supplier, typename = std::enable_if_t<std::is_invocable_v<Supplier&&>>>
    T OtherwiseThrow(Supplier&& supplier) && {
        if (IsEmpty()) {
            RaiseAbsent(std::forward<Supplier>(supplier));
        }
        return *std::move(value_);
    }

    /// Throws a default-constructed E when Unknown.
    template<typename E>
    const T& OtherwiseThrow() const& {
        if (IsEmpty()) {
            RaiseAbsent(ErrorSuppliers::Exception<E>());
        }
        return *value_;
    }

    template<typename E>
    T OtherwiseThrow() && {
        if (IsEmpty()) {
            RaiseAbsent(ErrorSuppliers::Exception<E>());
        }
        return *std::move(value_);
    }

    /// Throws E constructed from message when Unknown.
    template<typename E>
    const T& OtherwiseThrow(const std::string& message) const& {
        if (IsEmpty()) {
            RaiseAbsent(ErrorSuppliers::Exception<E>(message));
        }
        return *value_;
    }

    template<typename E>
    T OtherwiseThrow(const std::string& message) && {
        if (IsEmpty()) {
            RaiseAbsent(ErrorSuppliers::Exception<E>(message));
        }
        return *std::move(value_);
    }

    /**
     * @brief Ok(value) when Known, Err(supplier()) when Unknown
     *
     * Same contract as OtherwiseThrow without unwinding the stack.
     */
    template<typename Supplier>
    [[nodiscard]] auto OtherwiseErr(Supplier&& supplier) const&
        -> Result<T, std::decay_t<std::invoke_result_t<Supplier&&>>> {
        using ResultType = Result<T, std::decay_t<std::invoke_result_t<Supplier&&>>>;
        if (IsEmpty()) {
            debug::LogAbsentValueErr();
            return ResultType::Err(std::invoke(std::forward<Supplier>(supplier)));
        }
        return ResultType::Ok(*value_);
    }

    template<typename Supplier>
    [[nodiscard]] auto OtherwiseErr(Supplier&& supplier) &&
        -> Result<T, std::decay_t<std::invoke_result_t<Supplier&&>>> {
        using ResultType = Result<T, std::decay_t<std::invoke_result_t<Supplier&&>>>;
        if (IsEmpty()) {
            debug::LogAbsentValueErr();
            return ResultType::Err(std::invoke(std::forward<Supplier>(supplier)));
        }
        return ResultType::Ok(*std::move(value_));
    }

    // ========================================================================
    // Conversion
    // ========================================================================

    [[nodiscard]] std::optional<T> ToOptional() const& { return value_; }

    [[nodiscard]] std::optional<T> ToOptional() && { return std::move(value_); }

    [[nodiscard]] std::string ToString(
        const configuration::DisplayConfig config = configuration::DisplayConfig::Default()) const {
        if (IsEmpty()) {
            return std::string(config.UnknownLabel());
        }
        return compat::format("{}{}{}", config.KnownPrefix(), *value_, config.KnownSuffix());
    }

    // ========================================================================
    // Zero-or-one sequence
    // ========================================================================

    [[nodiscard]] const_iterator begin() const noexcept {
        return IsKnown() ? std::addressof(*value_) : nullptr;
    }

    [[nodiscard]] const_iterator end() const noexcept {
        return IsKnown() ? std::addressof(*value_) + 1 : nullptr;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return IsKnown() ? MaybeConstants::KNOWN_ELEMENT_COUNT : MaybeConstants::UNKNOWN_ELEMENT_COUNT;
    }

    // ========================================================================
    // Equality and hashing
    // ========================================================================

    [[nodiscard]] bool operator==(const Maybe& other) const {
        if (IsKnown() != other.IsKnown()) {
            return false;
        }
        if (IsEmpty()) {
            return true;
        }
        return *value_ == *other.value_;
    }

    /// Consistent with operator==: constant for Unknown, std::hash<T> for Known.
    [[nodiscard]] std::size_t Hash() const {
        if (IsEmpty()) {
            return MaybeConstants::UNKNOWN_HASH;
        }
        return std::hash<T>{}(*value_);
    }

    friend std::ostream& operator<<(std::ostream& os, const Maybe& maybe) {
        return os << maybe.ToString();
    }

private:
    Maybe() noexcept = default;

    template<typename... Args>
    explicit Maybe(std::in_place_t tag, Args&&... args)
        : value_(tag, std::forward<Args>(args)...) {}

    template<typename Supplier>
    [[noreturn]] static void RaiseAbsent(Supplier&& supplier) {
        using E = std::decay_t<std::invoke_result_t<Supplier&&>>;
        debug::LogAbsentValueFailure(typeid(E).name());
        throw std::invoke(std::forward<Supplier>(supplier));
    }

    std::optional<T> value_;
};

template<typename T>
[[nodiscard]] Maybe<std::decay_t<T>> Definitely(T&& value) {
    return Maybe<std::decay_t<T>>::Definitely(std::forward<T>(value));
}

template<typename T>
[[nodiscard]] Maybe<T> MaybeOf(const T* value) {
    return Maybe<T>::Of(value);
}

} // namespace nullsafe

namespace std {

template<typename T>
struct hash<nullsafe::Maybe<T>> {
    size_t operator()(const nullsafe::Maybe<T>& maybe) const {
        return maybe.Hash();
    }
};

} // namespace std

namespace fmt {

template<typename T>
struct formatter<nullsafe::Maybe<T>> : formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const nullsafe::Maybe<T>& maybe, FormatContext& ctx) const {
        const std::string rendered = maybe.ToString();
        return formatter<std::string_view>::format(rendered, ctx);
    }
};

} // namespace fmt
