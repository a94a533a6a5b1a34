#pragma once

#include <string>
#include <utility>
#include <variant>

namespace stegbridge {

enum class ErrorKind {
    NoFilePart,
    NoFileSelected,
    FileTypeNotAllowed,
    NoImageData,
    DecodeError,
    EncodeError,
    ProcessingError
};

struct Error {
    ErrorKind kind = ErrorKind::ProcessingError;
    std::string message;
};

const char* ErrorKindName(ErrorKind kind);

// 400 for client input errors, 500 for processing faults.
int HttpStatusFor(ErrorKind kind);

template <typename T>
class Result {
public:
    Result(T value) : state_(std::move(value)) {}
    Result(Error error) : state_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(state_); }
    explicit operator bool() const { return ok(); }

    T& value() { return std::get<T>(state_); }
    const T& value() const { return std::get<T>(state_); }
    const Error& error() const { return std::get<Error>(state_); }

private:
    std::variant<T, Error> state_;
};

inline Error MakeError(ErrorKind kind, std::string message) {
    return Error{kind, std::move(message)};
}

}  // namespace stegbridge
