#pragma once
#include <string>
#include <utility>
#include <variant>

namespace agentbridge {
namespace utils {

// Holds either a value of type T or an error message.
template <typename T>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    static Result failure(std::string error) {
        return Result(Error{std::move(error)});
    }

    bool has_value() const { return std::holds_alternative<T>(data_); }
    bool has_error() const { return std::holds_alternative<Error>(data_); }
    explicit operator bool() const { return has_value(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }
    const std::string& error() const { return std::get<Error>(data_).message; }

private:
    // Wrapper so that Result<std::string> stays unambiguous.
    struct Error {
        std::string message;
    };

    explicit Result(Error error) : data_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
    Result() : success_(true) {}

    static Result failure(std::string error) {
        Result r;
        r.success_ = false;
        r.error_ = std::move(error);
        return r;
    }

    bool has_value() const { return success_; }
    bool has_error() const { return !success_; }
    explicit operator bool() const { return success_; }
    const std::string& error() const { return error_; }

private:
    bool success_ = false;
    std::string error_;
};

} // namespace utils

using utils::Result;

} // namespace agentbridge
