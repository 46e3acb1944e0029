#pragma once
#include <string>
#include <utility>
#include <variant>

namespace relaunch {
namespace utils {

// Error payload carried by a failed Result.
struct Error {
    std::string message;
};

// Generic Result<T> template
// Holds either a value of type T or an Error. The error side is a distinct
// type so Result<std::string> stays unambiguous.

template <typename T>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    static Result failure(std::string message) {
        return Result(Error{std::move(message)});
    }

    bool has_value() const { return std::holds_alternative<T>(data_); }
    bool has_error() const { return std::holds_alternative<Error>(data_); }
    explicit operator bool() const { return has_value(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }
    const std::string& error() const { return std::get<Error>(data_).message; }

private:
    std::variant<T, Error> data_;
};

// Specialization for void

template <>
class Result<void> {
public:
    Result() : success_(true) {}
    Result(Error error) : success_(false), error_(std::move(error.message)) {}

    static Result failure(std::string message) {
        return Result(Error{std::move(message)});
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
} // namespace relaunch

namespace relaunch {
using utils::Result;
}
