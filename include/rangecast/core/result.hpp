// RangeCast - Seekable media delivery engine
// Result type for error propagation without exceptions

#ifndef RANGECAST_CORE_RESULT_HPP
#define RANGECAST_CORE_RESULT_HPP

#include <stdexcept>
#include <utility>
#include <variant>

namespace rangecast {
namespace core {

/**
 * @brief Either a success value of type T or an error of type E.
 *
 * Every fallible operation in RangeCast returns a Result. Accessing the
 * wrong alternative throws std::logic_error, which indicates a programming
 * error rather than a runtime condition.
 *
 * @tparam T Success value type
 * @tparam E Error type
 */
template<typename T, typename E>
class Result {
public:
    static Result success(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result error(E err) {
        return Result(std::in_place_index<1>, std::move(err));
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return storage_.index() == 0;
    }

    [[nodiscard]] bool isError() const noexcept {
        return storage_.index() == 1;
    }

    /**
     * @brief Access the success value.
     * @throws std::logic_error if this is an error result
     */
    [[nodiscard]] T& value() & {
        requireSuccess();
        return std::get<0>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        requireSuccess();
        return std::get<0>(storage_);
    }

    [[nodiscard]] T&& value() && {
        requireSuccess();
        return std::get<0>(std::move(storage_));
    }

    /**
     * @brief Access the error value.
     * @throws std::logic_error if this is a success result
     */
    [[nodiscard]] E& error() & {
        requireError();
        return std::get<1>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        requireError();
        return std::get<1>(storage_);
    }

    /**
     * @brief Success value, or the given fallback when this is an error.
     */
    [[nodiscard]] T valueOr(T fallback) const& {
        return isSuccess() ? std::get<0>(storage_) : std::move(fallback);
    }

    [[nodiscard]] T valueOr(T fallback) && {
        return isSuccess() ? std::get<0>(std::move(storage_)) : std::move(fallback);
    }

    Result(Result&&) = default;
    Result& operator=(Result&&) = default;
    Result(const Result&) = default;
    Result& operator=(const Result&) = default;

private:
    template<size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v)
        : storage_(tag, std::forward<V>(v)) {}

    void requireSuccess() const {
        if (!isSuccess()) {
            throw std::logic_error("Result: value() called on an error result");
        }
    }

    void requireError() const {
        if (!isError()) {
            throw std::logic_error("Result: error() called on a success result");
        }
    }

    // Indexed alternatives so T and E may be the same type.
    std::variant<T, E> storage_;
};

/**
 * @brief Result specialization for operations with no success value.
 */
template<typename E>
class Result<void, E> {
public:
    static Result success() {
        return Result();
    }

    static Result error(E err) {
        Result r;
        r.error_ = std::move(err);
        r.failed_ = true;
        return r;
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return !failed_;
    }

    [[nodiscard]] bool isError() const noexcept {
        return failed_;
    }

    [[nodiscard]] E& error() & {
        if (!failed_) {
            throw std::logic_error("Result: error() called on a success result");
        }
        return error_;
    }

    [[nodiscard]] const E& error() const& {
        if (!failed_) {
            throw std::logic_error("Result: error() called on a success result");
        }
        return error_;
    }

    Result(Result&&) = default;
    Result& operator=(Result&&) = default;
    Result(const Result&) = default;
    Result& operator=(const Result&) = default;

private:
    Result() = default;

    E error_{};
    bool failed_{false};
};

} // namespace core
} // namespace rangecast

#endif // RANGECAST_CORE_RESULT_HPP
