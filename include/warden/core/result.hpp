#pragma once
#include <variant>
#include <utility>
#include <type_traits>
#include <stdexcept>
#include <optional>
namespace warden {
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
};
inline constexpr Unit unit{};
template<typename T, typename E>
class Result {
    static constexpr std::size_t OK_INDEX = 0;
    static constexpr std::size_t ERR_INDEX = 1;
    std::variant<T, E> state_;
public:
    using value_type = T;
    using error_type = E;
    static Result Ok(T value) {
        return Result(std::in_place_index<OK_INDEX>, std::move(value));
    }
    static Result Err(E error) {
        return Result(std::in_place_index<ERR_INDEX>, std::move(error));
    }
    static Result FromOptional(std::optional<T> value, E error_if_empty) {
        if (value.has_value()) {
            return Ok(std::move(*value));
        }
        return Err(std::move(error_if_empty));
    }
    [[nodiscard]] bool IsOk() const noexcept { return state_.index() == OK_INDEX; }
    [[nodiscard]] bool IsErr() const noexcept { return state_.index() == ERR_INDEX; }
    template<typename Pred>
    [[nodiscard]] bool IsErrAnd(Pred&& pred) const {
        return IsErr() && std::forward<Pred>(pred)(std::get<ERR_INDEX>(state_));
    }
    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<OK_INDEX>(state_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<OK_INDEX>(state_);
    }
    [[nodiscard]] T&& Unwrap() && {
        RequireOk();
        return std::get<OK_INDEX>(std::move(state_));
    }
    [[nodiscard]] E& UnwrapErr() & {
        RequireErr();
        return std::get<ERR_INDEX>(state_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<ERR_INDEX>(state_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        RequireErr();
        return std::get<ERR_INDEX>(std::move(state_));
    }
    [[nodiscard]] T UnwrapOr(T fallback) && {
        if (IsOk()) {
            return std::get<OK_INDEX>(std::move(state_));
        }
        return fallback;
    }
    template<typename F>
    [[nodiscard]] auto Map(F&& func) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (IsErr()) {
            return Result<U, E>::Err(std::get<ERR_INDEX>(std::move(state_)));
        }
        return Result<U, E>::Ok(std::forward<F>(func)(std::get<OK_INDEX>(std::move(state_))));
    }
    template<typename F>
    [[nodiscard]] auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E>> {
        using U = std::invoke_result_t<F, E>;
        if (IsOk()) {
            return Result<T, U>::Ok(std::get<OK_INDEX>(std::move(state_)));
        }
        return Result<T, U>::Err(std::forward<F>(func)(std::get<ERR_INDEX>(std::move(state_))));
    }
    template<typename F>
    [[nodiscard]] auto Bind(F&& func) && -> std::invoke_result_t<F, T> {
        using Next = std::invoke_result_t<F, T>;
        static_assert(std::is_same_v<typename Next::error_type, E>,
                      "Bind continuation must keep the error type");
        if (IsErr()) {
            return Next::Err(std::get<ERR_INDEX>(std::move(state_)));
        }
        return std::forward<F>(func)(std::get<OK_INDEX>(std::move(state_)));
    }
    [[nodiscard]] std::optional<T> Ok() && {
        if (IsOk()) {
            return std::get<OK_INDEX>(std::move(state_));
        }
        return std::nullopt;
    }
    [[nodiscard]] std::optional<E> Err() && {
        if (IsErr()) {
            return std::get<ERR_INDEX>(std::move(state_));
        }
        return std::nullopt;
    }
private:
    template<std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> tag, Args&&... args)
        : state_(tag, std::forward<Args>(args)...) {}
    void RequireOk() const {
        if (IsErr()) {
            throw std::logic_error("Unwrap() called on an Err result");
        }
    }
    void RequireErr() const {
        if (IsOk()) {
            throw std::logic_error("UnwrapErr() called on an Ok result");
        }
    }
};
/// Propagates the error of a Result whose Ok type differs from the enclosing function's.
#define WARDEN_TRY_ERR(ReturnType, result_expr)                                  \
    do {                                                                         \
        auto&& warden_try_result_ = (result_expr);                               \
        if (warden_try_result_.IsErr()) {                                        \
            return ReturnType::Err(std::move(warden_try_result_).UnwrapErr());   \
        }                                                                        \
    } while (0)
}
