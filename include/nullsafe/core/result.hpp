#pragma once
#include "nullsafe/core/constants.hpp"
#include "nullsafe/core/failures.hpp"
#include <variant>
#include <utility>
#include <type_traits>
#include <optional>
#include <string>
namespace nullsafe {
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
};
inline constexpr Unit unit{};
/**
 * @brief Either a success value or an error value, never both.
 *
 * Used where a failure should travel back to the caller as a value instead
 * of unwinding the stack (see Maybe::OtherwiseErr).
 */
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;
    static Result Ok(T value) {
        return Result(std::in_place_index<OK_INDEX>, std::move(value));
    }
    static Result Err(E error) {
        return Result(std::in_place_index<ERR_INDEX>, std::move(error));
    }
    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == OK_INDEX; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == ERR_INDEX; }
    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<OK_INDEX>(storage_);
    }
    [[nodiscard]] T Unwrap() && {
        RequireOk();
        return std::get<OK_INDEX>(std::move(storage_));
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<ERR_INDEX>(storage_);
    }
    [[nodiscard]] E UnwrapErr() && {
        RequireErr();
        return std::get<ERR_INDEX>(std::move(storage_));
    }
    [[nodiscard]] T UnwrapOr(T default_value) const& {
        if (IsOk()) {
            return std::get<OK_INDEX>(storage_);
        }
        return default_value;
    }
    [[nodiscard]] T UnwrapOr(T default_value) && {
        if (IsOk()) {
            return std::get<OK_INDEX>(std::move(storage_));
        }
        return default_value;
    }
    template<typename F>
    [[nodiscard]] auto Map(F&& func) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (IsErr()) {
            return Result<U, E>::Err(std::get<ERR_INDEX>(std::move(storage_)));
        }
        return Result<U, E>::Ok(std::forward<F>(func)(std::get<OK_INDEX>(std::move(storage_))));
    }
    template<typename F>
    [[nodiscard]] auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E>> {
        using U = std::invoke_result_t<F, E>;
        if (IsOk()) {
            return Result<T, U>::Ok(std::get<OK_INDEX>(std::move(storage_)));
        }
        return Result<T, U>::Err(std::forward<F>(func)(std::get<ERR_INDEX>(std::move(storage_))));
    }
    template<typename F>
    [[nodiscard]] auto Bind(F&& func) && -> std::invoke_result_t<F, T> {
        using ResultType = std::invoke_result_t<F, T>;
        static_assert(std::is_same_v<typename ResultType::error_type, E>,
                      "Bind function must return Result with same error type");
        if (IsErr()) {
            return ResultType::Err(std::get<ERR_INDEX>(std::move(storage_)));
        }
        return std::forward<F>(func)(std::get<OK_INDEX>(std::move(storage_)));
    }
    [[nodiscard]] std::optional<T> Ok() && {
        if (IsOk()) {
            return std::get<OK_INDEX>(std::move(storage_));
        }
        return std::nullopt;
    }
private:
    static constexpr std::size_t OK_INDEX = 0;
    static constexpr std::size_t ERR_INDEX = 1;
    template<std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : storage_(idx, std::forward<Args>(args)...) {}
    void RequireOk() const {
        if (IsErr()) {
            throw IllegalStateError(std::string(ErrorMessages::UNWRAP_ON_ERR));
        }
    }
    void RequireErr() const {
        if (IsOk()) {
            throw IllegalStateError(std::string(ErrorMessages::UNWRAP_ERR_ON_OK));
        }
    }
    std::variant<T, E> storage_;
};
}
