#ifndef RACCOON_RESULT_H
#define RACCOON_RESULT_H

#include <raccoon/config.h>
#include <raccoon/error.h>
#include <type_traits>
#include <utility>
#include <variant>

namespace raccoon {

/**
 * Either a value of type T or a RaccoonError.
 *
 * Reading the value of a failed Result throws RaccoonException carrying
 * the stored error. operator-> yields nullptr on failure.
 */
template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(RaccoonError error) : data_(error) {}

    bool is_success() const noexcept { return data_.index() == 0; }
    bool is_error() const noexcept { return data_.index() == 1; }
    explicit operator bool() const noexcept { return is_success(); }

    RaccoonError error() const noexcept {
        return is_success() ? RaccoonError::SUCCESS : std::get<1>(data_);
    }

    const T& value() const & {
        check();
        return std::get<0>(data_);
    }

    T& value() & {
        check();
        return std::get<0>(data_);
    }

    T value() && {
        check();
        return std::move(std::get<0>(data_));
    }

    const T& operator*() const & { return value(); }
    T& operator*() & { return value(); }
    T operator*() && { return std::move(*this).value(); }

    const T* operator->() const { return std::get_if<0>(&data_); }
    T* operator->() { return std::get_if<0>(&data_); }

private:
    void check() const {
        if (is_error()) {
            throw RaccoonException(std::get<1>(data_));
        }
    }

    std::variant<T, RaccoonError> data_;
};

// Outcome of an operation without a value
template<>
class Result<void> {
public:
    Result() noexcept : error_(RaccoonError::SUCCESS) {}
    Result(RaccoonError error) noexcept : error_(error) {}

    bool is_success() const noexcept { return error_ == RaccoonError::SUCCESS; }
    bool is_error() const noexcept { return !is_success(); }
    explicit operator bool() const noexcept { return is_success(); }

    RaccoonError error() const noexcept { return error_; }

private:
    RaccoonError error_;
};

template<typename T>
Result<std::decay_t<T>> make_result(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

inline Result<void> make_result() {
    return Result<void>();
}

template<typename T>
Result<T> make_error(RaccoonError error) {
    return Result<T>(error);
}

// Evaluates expr once and returns its error from the enclosing function
#define RACCOON_TRY_VOID(expr) \
    do { \
        auto _raccoon_result = (expr); \
        if (_raccoon_result.is_error()) { \
            return _raccoon_result.error(); \
        } \
    } while (0)

} // namespace raccoon

#endif // RACCOON_RESULT_H
