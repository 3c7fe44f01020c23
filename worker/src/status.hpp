
#pragma once
#include <string>
#include <utility>

// Failure categories reported by the pipeline stages
enum class ErrorKind {
    None,
    Validation,
    Read,
    Probe,
    Persistence,
    Delivery,
    Log,
    Rotation
};

std::string to_string(ErrorKind kind);

struct Status {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }

    static Status success() { return Status{}; }
    static Status failure(ErrorKind kind, std::string message) {
        return Status{kind, std::move(message)};
    }
};

template <typename T>
struct Result {
    Status status;
    T value{};

    bool ok() const { return status.ok(); }

    static Result success(T value) { return Result{Status::success(), std::move(value)}; }
    static Result failure(ErrorKind kind, std::string message) {
        return Result{Status::failure(kind, std::move(message)), T{}};
    }
};
