#pragma once
#include <cstddef>
#include <string_view>

namespace constants
{
// Bluetooth SIG base UUID; 16/32-bit short forms expand into it.
inline constexpr std::string_view BASE_UUID_SUFFIX = "-0000-1000-8000-00805f9b34fb";

// Descriptors whose numeric values are unsigned 16-bit
inline constexpr std::string_view CHAR_EXTENDED_PROPERTIES = "00002900-0000-1000-8000-00805f9b34fb";
inline constexpr std::string_view CLIENT_CHAR_CONFIG       = "00002902-0000-1000-8000-00805f9b34fb";
inline constexpr std::string_view SERVER_CHAR_CONFIG       = "00002903-0000-1000-8000-00805f9b34fb";
// L2CAP PSM characteristic (Apple-defined). Whether its value is a 16-bit number is unclear.
inline constexpr std::string_view L2CAP_PSM_CHARACTERISTIC = "abdd3056-28fa-441d-a470-55a75a52553a";

// ATT default MTU when the stack does not report a negotiated one
inline constexpr int DEFAULT_ATT_MTU = 23;

// Undrained events kept per subscriber; the oldest are dropped beyond this
inline constexpr std::size_t OBSERVATION_BACKLOG = 256;

// Longest wait for the native stack to confirm a requested teardown
inline constexpr int TEARDOWN_SETTLE_MS = 2000;

inline constexpr const char *DEFAULT_ADAPTER = "hci0";

}  // namespace constants
