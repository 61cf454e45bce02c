// include/tabvault/storage_error/result.h
#pragma once

#include "storage_error.h"
#include <optional>
#include <stdexcept>
#include <utility>

namespace tabvault {
namespace storage {

/**
 * @brief Holds either a value produced by a store operation or the StorageError that prevented it.
 */
template<typename T>
class Result {
private:
    std::optional<T> value_;
    std::optional<StorageError> error_;

public:
    Result(T val) : value_(std::move(val)) {}
    Result(StorageError err) : error_(std::move(err)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool hasValue() const { return value_.has_value(); }
    bool hasError() const { return error_.has_value(); }
    bool isOk() const { return hasValue(); }
    explicit operator bool() const { return isOk(); }

    const T& value() const& {
        if (!hasValue()) throw std::logic_error("Result holds an error: " + error_->toString());
        return *value_;
    }
    T& value() & {
        if (!hasValue()) throw std::logic_error("Result holds an error: " + error_->toString());
        return *value_;
    }
    T&& value() && {
        if (!hasValue()) throw std::logic_error("Result holds an error: " + error_->toString());
        return std::move(*value_);
    }

    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }
    const T& operator*() const& { return value(); }
    T& operator*() & { return value(); }

    const StorageError& error() const& {
        if (!hasError()) throw std::logic_error("Result holds a value, not an error");
        return *error_;
    }
    StorageError& error() & {
        if (!hasError()) throw std::logic_error("Result holds a value, not an error");
        return *error_;
    }
    StorageError&& error() && {
        if (!hasError()) throw std::logic_error("Result holds a value, not an error");
        return std::move(*error_);
    }

    T valueOr(T fallback) const& {
        return hasValue() ? *value_ : std::move(fallback);
    }
    T valueOr(T fallback) && {
        return hasValue() ? std::move(*value_) : std::move(fallback);
    }

    // Applies func to the value, propagating the error untouched
    template<typename F>
    auto map(F&& func) const& -> Result<decltype(func(std::declval<const T&>()))> {
        using U = decltype(func(std::declval<const T&>()));
        if (hasValue()) return Result<U>(func(*value_));
        return Result<U>(*error_);
    }

    template<typename F>
    Result<T> mapError(F&& func) const& {
        if (hasError()) return Result<T>(func(*error_));
        return *this;
    }
};

template<>
class Result<void> {
private:
    std::optional<StorageError> error_;

public:
    Result() = default;
    Result(StorageError err) : error_(std::move(err)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool hasError() const { return error_.has_value(); }
    bool isOk() const { return !hasError(); }
    explicit operator bool() const { return isOk(); }

    const StorageError& error() const& {
        if (!hasError()) throw std::logic_error("Status is OK, no error to access");
        return *error_;
    }
    StorageError& error() & {
        if (!hasError()) throw std::logic_error("Status is OK, no error to access");
        return *error_;
    }
    StorageError&& error() && {
        if (!hasError()) throw std::logic_error("Status is OK, no error to access");
        return std::move(*error_);
    }

    template<typename F>
    Result<void> mapError(F&& func) const& {
        if (hasError()) return Result<void>(func(*error_));
        return *this;
    }
};

// Operations that return nothing but can fail
using Status = Result<void>;

} // namespace storage
} // namespace tabvault
