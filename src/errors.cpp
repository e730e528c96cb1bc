#include "errors.hpp"

#include <array>
#include <utility>

namespace livecall {

namespace {

constexpr std::array<std::pair<ErrorCode, const char*>, 15> ErrorNames{{
    {ErrorCode::RoomFull, "RoomFull"},
    {ErrorCode::RoomNotFound, "RoomNotFound"},
    {ErrorCode::AlreadyJoined, "AlreadyJoined"},
    {ErrorCode::ChannelClosed, "ChannelClosed"},
    {ErrorCode::NegotiationTimeout, "NegotiationTimeout"},
    {ErrorCode::IceFailure, "IceFailure"},
    {ErrorCode::DeviceUnavailable, "DeviceUnavailable"},
    {ErrorCode::UserCancelledCapture, "UserCancelledCapture"},
    {ErrorCode::AlreadySharing, "AlreadySharing"},
    {ErrorCode::AdmissionDenied, "AdmissionDenied"},
    {ErrorCode::CallFailed, "CallFailed"},
    {ErrorCode::PeerDisconnected, "PeerDisconnected"},
    {ErrorCode::InvalidHandle, "InvalidHandle"},
    {ErrorCode::TransportError, "TransportError"},
    {ErrorCode::InvalidMessage, "InvalidMessage"},
}};

} // namespace

const char* ToString(ErrorCode code) {
    for (const auto& [value, name] : ErrorNames) {
        if (value == code) {
            return name;
        }
    }
    return "Unknown";
}

} // namespace livecall
