#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace livecall {

enum class ErrorCode {
    RoomFull,
    RoomNotFound,
    AlreadyJoined,
    ChannelClosed,
    NegotiationTimeout,
    IceFailure,
    DeviceUnavailable,
    UserCancelledCapture,
    AlreadySharing,
    AdmissionDenied,
    CallFailed,
    PeerDisconnected,
    InvalidHandle,
    TransportError,
    InvalidMessage,
};

struct Error {
    ErrorCode code;
    std::string message;
};

const char* ToString(ErrorCode code);

inline Error MakeError(ErrorCode code, std::string message = {}) {
    return Error{code, std::move(message)};
}

// Expected conditions travel as values; T and Error must be distinct types.
template <typename T>
class Result {
public:
    Result(T value)
        : Value_(std::move(value))
    { }

    Result(Error error)
        : Value_(std::move(error))
    { }

    bool Ok() const {
        return std::holds_alternative<T>(Value_);
    }

    explicit operator bool() const {
        return Ok();
    }

    T& Value() {
        return std::get<T>(Value_);
    }

    const T& Value() const {
        return std::get<T>(Value_);
    }

    const Error& GetError() const {
        return std::get<Error>(Value_);
    }

private:
    std::variant<T, Error> Value_;
};

template <>
class Result<void> {
public:
    Result() = default;

    Result(Error error)
        : Error_(std::move(error))
    { }

    bool Ok() const {
        return !Error_.has_value();
    }

    explicit operator bool() const {
        return Ok();
    }

    const Error& GetError() const {
        return *Error_;
    }

private:
    std::optional<Error> Error_;
};

} // namespace livecall
