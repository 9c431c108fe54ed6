#pragma once

#include <variant>
#include <string>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace listall {

/**
 * Error - a failure with a message and an optional numeric code.
 *
 * Storage code puts the SQLite result code in `code`.
 */
struct Error {
    std::string message;
    int code{0};

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}

    bool operator==(const Error&) const = default;
};

namespace detail {

template<typename E>
[[noreturn]] void throw_unwrap_error(const E& error) {
    if constexpr (std::is_same_v<E, Error>) {
        throw std::runtime_error("Result::unwrap() called on error: " + error.message);
    } else if constexpr (requires { error.describe(); }) {
        throw std::runtime_error("Result::unwrap() called on error: " + error.describe());
    } else {
        throw std::runtime_error("Result::unwrap() called on error");
    }
}

} // namespace detail

/**
 * Result<T, E> - either a success value (ok) or an error (err).
 *
 * Every fallible operation in listall returns one of these instead of throwing.
 *
 *   Result<Uuid> parse_id(std::string_view text);
 *
 *   auto name = parse_id(raw)
 *       .and_then([&](const Uuid& id) { return store.find_list(id); })
 *       .map([](const auto& list) { return list ? list->name : std::string{}; });
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return data_.index() == 1; }

    /**
     * Access the value. Throws std::runtime_error when this holds an error,
     * so only call it after checking is_ok() (tests may call it directly).
     */
    [[nodiscard]] T& unwrap() & {
        if (is_err()) detail::throw_unwrap_error(std::get<1>(data_));
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        if (is_err()) detail::throw_unwrap_error(std::get<1>(data_));
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        if (is_err()) detail::throw_unwrap_error(std::get<1>(data_));
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) throw std::runtime_error("Result::unwrap_err() called on success");
        return std::get<1>(data_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) throw std::runtime_error("Result::unwrap_err() called on success");
        return std::get<1>(data_);
    }

    [[nodiscard]] E unwrap_err() && {
        if (is_ok()) throw std::runtime_error("Result::unwrap_err() called on success");
        return std::get<1>(std::move(data_));
    }

    [[nodiscard]] T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(data_) : std::move(fallback);
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
        }
        return Result<U, E>::err(std::get<1>(data_));
    }

    template<typename F>
    [[nodiscard]] auto map(F&& f) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(std::move(data_))));
        }
        return Result<U, E>::err(std::get<1>(std::move(data_)));
    }

    /**
     * map_err : Result<T, E> -> (E -> F) -> Result<T, F>
     */
    template<typename F>
    [[nodiscard]] auto map_err(F&& f) const& -> Result<T, std::invoke_result_t<F, const E&>> {
        using NewE = std::invoke_result_t<F, const E&>;
        if (is_err()) {
            return Result<T, NewE>::err(std::invoke(std::forward<F>(f), std::get<1>(data_)));
        }
        return Result<T, NewE>::ok(std::get<0>(data_));
    }

    template<typename F>
    [[nodiscard]] auto map_err(F&& f) && -> Result<T, std::invoke_result_t<F, E>> {
        using NewE = std::invoke_result_t<F, E>;
        if (is_err()) {
            return Result<T, NewE>::err(std::invoke(std::forward<F>(f), std::get<1>(std::move(data_))));
        }
        return Result<T, NewE>::ok(std::get<0>(std::move(data_)));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using ResultU = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(data_));
        }
        return ResultU::err(std::get<1>(data_));
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using ResultU = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
        }
        return ResultU::err(std::get<1>(std::move(data_)));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    // Index based so that T and E may be the same type.
    std::variant<T, E> data_;
};

/**
 * Result<void, E> - success carries no value.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() { return Result(); }
    [[nodiscard]] static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool is_ok() const noexcept { return !failed_; }
    [[nodiscard]] bool is_err() const noexcept { return failed_; }

    void unwrap() const {
        if (failed_) detail::throw_unwrap_error(error_);
    }

    [[nodiscard]] E& unwrap_err() & {
        if (!failed_) throw std::runtime_error("Result::unwrap_err() called on success");
        return error_;
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (!failed_) throw std::runtime_error("Result::unwrap_err() called on success");
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto map_err(F&& f) const -> Result<void, std::invoke_result_t<F, const E&>> {
        using NewE = std::invoke_result_t<F, const E&>;
        if (failed_) {
            return Result<void, NewE>::err(std::invoke(std::forward<F>(f), error_));
        }
        return Result<void, NewE>::ok();
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (!failed_) {
            return std::invoke(std::forward<F>(f));
        }
        return ResultU::err(error_);
    }

private:
    Result() = default;
    explicit Result(E error) : failed_(true), error_(std::move(error)) {}

    bool failed_ = false;
    E error_{};
};

} // namespace listall
