/**
 * @file MockupError.hpp
 * Error kinds shared by every stage of the mockup pipeline, and the Result
 * type the stages return so the CLI and the HTTP service can map each kind to
 * their own outcome (exit status, HTTP status).
 */
#pragma once
#include <string>
#include <utility>
#include <variant>

namespace mockup {

enum class ErrorKind
{
    Detection = 0,     // no bright frame region in a reference image
    Configuration = 1, // catalog has no candidates for the orientation
    NoMatch = 2,       // candidates exist but none was chosen
    Margin = 3,        // margin swallows the whole frame
    Input = 4,         // bad upload or bad artwork dimensions
    Io = 5,            // image could not be read, decoded or written
};

inline const char* toString(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::Detection:     return "DetectionError";
    case ErrorKind::Configuration: return "ConfigurationError";
    case ErrorKind::NoMatch:       return "NoMatchError";
    case ErrorKind::Margin:        return "MarginError";
    case ErrorKind::Input:         return "InputError";
    case ErrorKind::Io:            return "IoError";
    }
    return "UnknownError";
}

struct MockupError
{
    ErrorKind kind {ErrorKind::Io};
    std::string message;

    MockupError() = default;
    MockupError(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}
};

/**
 * Either a value of T or a MockupError. Stages return this instead of
 * throwing; callers test ok() before touching value().
 */
template <typename T>
class Result
{
public:
    Result(T value) : data_(std::move(value)) {}
    Result(MockupError error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    T& value() { return std::get<T>(data_); }
    const T& value() const { return std::get<T>(data_); }

    const MockupError& error() const { return std::get<MockupError>(data_); }
    ErrorKind kind() const { return error().kind; }

private:
    std::variant<T, MockupError> data_;
};

}
