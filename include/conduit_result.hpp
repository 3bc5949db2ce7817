#pragma once
#include <variant>
#include <string>
#include <stdexcept>
#include <utility>

namespace conduit {

using Empty = std::monostate;

template<typename T, typename E>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : data_(std::in_place_index<1>, std::move(error)) {}

    bool is_ok() const {
        return data_.index() == 0;
    }

    bool is_err() const {
        return data_.index() == 1;
    }

    T& unwrap() {
        if (!is_ok()) throw std::runtime_error("Called unwrap on an error Result");
        return std::get<0>(data_);
    }

    const T& unwrap() const {
        if (!is_ok()) throw std::runtime_error("Called unwrap on an error Result");
        return std::get<0>(data_);
    }

    E& unwrap_err() {
        if (!is_err()) throw std::runtime_error("Called unwrap_err on an ok Result");
        return std::get<1>(data_);
    }

    const E& unwrap_err() const {
        if (!is_err()) throw std::runtime_error("Called unwrap_err on an ok Result");
        return std::get<1>(data_);
    }

private:
    std::variant<T, E> data_;
};

} // namespace conduit
