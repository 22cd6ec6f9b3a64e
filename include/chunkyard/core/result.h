#pragma once

#include <optional>
#include <utility>
#include <variant>

#include "chunkyard/core/error.h"

namespace chunkyard::core {

/// @brief Value-or-error return type; modules report failures through it instead of
/// throwing.
template <typename T>
class Result {
public:
    Result(const T& value) : state_(std::in_place_index<0>, value) {}
    Result(T&& value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(const Error& error) : state_(std::in_place_index<1>, error) {}
    Result(Error&& error) : state_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const { return state_.index() == 0; }
    const T& value() const { return std::get<0>(state_); }
    T& value() { return std::get<0>(state_); }
    /// @brief Only meaningful when !ok().
    const Error& error() const { return std::get<1>(state_); }

private:
    std::variant<T, Error> state_;
};

template <>
class Result<void> {
public:
    Result() = default;
    Result(const Error& error) : error_(error) {}
    Result(Error&& error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    void value() const {}
    const Error& error() const { return *error_; }

private:
    std::optional<Error> error_;
};

inline Result<void> Ok() { return Result<void>(); }

}  // namespace chunkyard::core
