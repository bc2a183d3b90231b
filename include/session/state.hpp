#pragma once
#include <optional>
#include <string>

namespace session
{

// HCI status codes (Bluetooth Core Vol 1 Part F) the adapters report for link failures.
// 0 means the link went down without an error (e.g. we asked for it).
namespace hci
{
constexpr int SUCCESS                   = 0x00;
constexpr int UNKNOWN_CONNECTION_ID     = 0x02;
constexpr int CONNECTION_TIMEOUT        = 0x08;
constexpr int CONNECTION_LIMIT_EXCEEDED = 0x09;
constexpr int REMOTE_USER_TERMINATED    = 0x13;
constexpr int REMOTE_LOW_RESOURCES      = 0x14;
constexpr int REMOTE_POWER_OFF          = 0x15;
constexpr int LOCAL_HOST_TERMINATED     = 0x16;
constexpr int LL_RESPONSE_TIMEOUT       = 0x22;
constexpr int MIC_FAILURE               = 0x3D;
constexpr int FAILED_TO_ESTABLISH       = 0x3E;
}  // namespace hci

enum class DisconnectReason
{
    Normal,  // peer went away cleanly
    Timeout,
    ConnectionLimitReached,
    EncryptionTimedOut,
    UnknownDevice,
    Cancelled,
    Failed,
    Unknown  // carries the raw code
};

struct DisconnectStatus
{
    DisconnectReason reason = DisconnectReason::Unknown;
    int              code   = 0;  // raw native code, always kept for diagnostics
};

// Unknown reasons compare by code; decoded reasons compare by reason only.
bool operator==(const DisconnectStatus &a, const DisconnectStatus &b);
bool operator!=(const DisconnectStatus &a, const DisconnectStatus &b);

// nullopt for code 0 (no error)
std::optional<DisconnectStatus> decode_disconnect_code(int code);

enum class ConnectPhase
{
    LinkEstablishing,
    DiscoveringServices,
    ConfiguringObservations
};

struct State
{
    enum class Kind
    {
        Disconnected,
        Connecting,
        Connected,
        Disconnecting
    };

    Kind                            kind  = Kind::Disconnected;
    ConnectPhase                    phase = ConnectPhase::LinkEstablishing;  // Connecting only
    std::optional<DisconnectStatus> status{};                                // Disconnected only

    static State disconnected(std::optional<DisconnectStatus> s = std::nullopt)
    {
        State st;
        st.kind   = Kind::Disconnected;
        st.status = s;
        return st;
    }
    static State connecting(ConnectPhase p)
    {
        State st;
        st.kind  = Kind::Connecting;
        st.phase = p;
        return st;
    }
    static State connected()
    {
        State st;
        st.kind = Kind::Connected;
        return st;
    }
    static State disconnecting()
    {
        State st;
        st.kind = Kind::Disconnecting;
        return st;
    }

    bool is_disconnected() const { return kind == Kind::Disconnected; }
    bool is_connected() const { return kind == Kind::Connected; }
    bool is_connecting(ConnectPhase p) const { return kind == Kind::Connecting && phase == p; }
};

bool operator==(const State &a, const State &b);
bool operator!=(const State &a, const State &b);

const char *to_string(DisconnectReason r);
const char *to_string(ConnectPhase p);
std::string to_string(const DisconnectStatus &s);
std::string to_string(const State &s);

}  // namespace session
