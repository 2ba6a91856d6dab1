#pragma once

#include "nearshare/core/transfer_error.hpp"
#include <optional>
#include <utility>
#include <variant>

namespace nearshare::core {

template<typename T>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(TransferError error) : data_(std::in_place_index<1>, std::move(error)) {}

    bool success() const { return data_.index() == 0; }
    explicit operator bool() const { return success(); }

    T& value() & { return std::get<0>(data_); }
    const T& value() const & { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    const TransferError& error() const { return std::get<1>(data_); }

private:
    std::variant<T, TransferError> data_;
};

template<>
class Result<void> {
public:
    Result() = default;
    Result(TransferError error) : error_(std::move(error)) {}

    static Result ok() { return Result(); }

    bool success() const { return !error_.has_value(); }
    explicit operator bool() const { return success(); }

    const TransferError& error() const { return *error_; }

private:
    std::optional<TransferError> error_;
};

} // namespace nearshare::core
