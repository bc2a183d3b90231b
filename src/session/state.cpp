#include <cstdio>

#include "session/state.hpp"

namespace session
{

bool operator==(const DisconnectStatus &a, const DisconnectStatus &b)
{
    if (a.reason != b.reason)
        return false;
    return a.reason != DisconnectReason::Unknown || a.code == b.code;
}

bool operator!=(const DisconnectStatus &a, const DisconnectStatus &b)
{
    return !(a == b);
}

std::optional<DisconnectStatus> decode_disconnect_code(int code)
{
    switch (code)
    {
        case hci::SUCCESS:
            return std::nullopt;
        case hci::REMOTE_USER_TERMINATED:
        case hci::REMOTE_LOW_RESOURCES:
        case hci::REMOTE_POWER_OFF:
            return DisconnectStatus{DisconnectReason::Normal, code};
        case hci::CONNECTION_TIMEOUT:
        case hci::LL_RESPONSE_TIMEOUT:
            return DisconnectStatus{DisconnectReason::Timeout, code};
        case hci::CONNECTION_LIMIT_EXCEEDED:
            return DisconnectStatus{DisconnectReason::ConnectionLimitReached, code};
        case hci::MIC_FAILURE:
            return DisconnectStatus{DisconnectReason::EncryptionTimedOut, code};
        case hci::UNKNOWN_CONNECTION_ID:
            return DisconnectStatus{DisconnectReason::UnknownDevice, code};
        case hci::LOCAL_HOST_TERMINATED:
            return DisconnectStatus{DisconnectReason::Cancelled, code};
        case hci::FAILED_TO_ESTABLISH:
            return DisconnectStatus{DisconnectReason::Failed, code};
        default:
            return DisconnectStatus{DisconnectReason::Unknown, code};
    }
}

bool operator==(const State &a, const State &b)
{
    if (a.kind != b.kind)
        return false;
    switch (a.kind)
    {
        case State::Kind::Connecting:
            return a.phase == b.phase;
        case State::Kind::Disconnected:
            return a.status == b.status;
        default:
            return true;
    }
}

bool operator!=(const State &a, const State &b)
{
    return !(a == b);
}

const char *to_string(DisconnectReason r)
{
    switch (r)
    {
        case DisconnectReason::Normal:
            return "normal";
        case DisconnectReason::Timeout:
            return "timeout";
        case DisconnectReason::ConnectionLimitReached:
            return "limit-reached";
        case DisconnectReason::EncryptionTimedOut:
            return "encryption-timeout";
        case DisconnectReason::UnknownDevice:
            return "unknown-device";
        case DisconnectReason::Cancelled:
            return "cancelled";
        case DisconnectReason::Failed:
            return "failed";
        case DisconnectReason::Unknown:
            return "unknown-code";
    }
    return "?";
}

const char *to_string(ConnectPhase p)
{
    switch (p)
    {
        case ConnectPhase::LinkEstablishing:
            return "LinkEstablishing";
        case ConnectPhase::DiscoveringServices:
            return "DiscoveringServices";
        case ConnectPhase::ConfiguringObservations:
            return "ConfiguringObservations";
    }
    return "?";
}

std::string to_string(const DisconnectStatus &s)
{
    char buf[48];
    if (s.reason == DisconnectReason::Unknown)
        std::snprintf(buf, sizeof(buf), "unknown-code(%d)", s.code);
    else
        std::snprintf(buf, sizeof(buf), "%s(0x%02x)", to_string(s.reason), s.code);
    return buf;
}

std::string to_string(const State &s)
{
    switch (s.kind)
    {
        case State::Kind::Disconnected:
            return s.status ? "Disconnected{" + to_string(*s.status) + "}" : "Disconnected";
        case State::Kind::Connecting:
            return std::string("Connecting{") + to_string(s.phase) + "}";
        case State::Kind::Connected:
            return "Connected";
        case State::Kind::Disconnecting:
            return "Disconnecting";
    }
    return "?";
}

}  // namespace session
