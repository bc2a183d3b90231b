#pragma once
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <string>

#include "adapter/native_adapter.hpp"

#if GATTLINK_HAVE_SDBUS
#include <systemd/sd-bus.h>
#endif

namespace adapter
{

static inline std::string lower(std::string s)
{
    for (auto &c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}

static inline bool ieq(const std::string &a, const std::string &b)
{
    return lower(a) == lower(b);
}

// "AA:BB:CC:DD:EE:FF" -> "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF"
static inline std::string device_path(const std::string &adapter_path, const DeviceId &mac)
{
    std::string tail = mac;
    for (auto &c : tail)
        c = (c == ':') ? '_' : (char)std::toupper((unsigned char)c);
    return adapter_path + "/dev_" + tail;
}

// true when obj_path is dev_path itself or one of its GATT objects
static inline bool path_under(const std::string &obj_path, const std::string &dev_path)
{
    if (dev_path.empty() || obj_path.compare(0, dev_path.size(), dev_path) != 0)
        return false;
    return obj_path.size() == dev_path.size() || obj_path[dev_path.size()] == '/';
}

// GattCharacteristic1.Flags entry -> property bit (0 when unknown)
static inline std::uint32_t flag_to_property(const std::string &flag)
{
    if (flag == "broadcast")
        return props::Broadcast;
    if (flag == "read")
        return props::Read;
    if (flag == "write-without-response")
        return props::WriteWithoutResponse;
    if (flag == "write")
        return props::Write;
    if (flag == "notify")
        return props::Notify;
    if (flag == "indicate")
        return props::Indicate;
    if (flag == "authenticated-signed-writes")
        return props::SignedWrite;
    if (flag == "extended-properties")
        return props::ExtendedProperties;
    return 0;
}

// Device1.Disconnected reason -> HCI status. A locally requested disconnect is not an error.
static inline int hci_status_for_reason(const std::string &reason)
{
    if (reason == "org.bluez.Reason.Local")
        return 0x00;
    if (reason == "org.bluez.Reason.Timeout")
        return 0x08;  // connection timeout
    if (reason == "org.bluez.Reason.Remote")
        return 0x13;  // remote user terminated
    if (reason == "org.bluez.Reason.Authentication")
        return 0x05;  // authentication failure
    if (reason == "org.bluez.Reason.Suspend")
        return 0x16;  // terminated by local host
    return 0x1F;      // unspecified error
}

// Device1.Connect error name -> HCI status reported with ConnectFailed
static inline int hci_status_for_connect_error(const std::string &name)
{
    if (name == "org.freedesktop.DBus.Error.NoReply" || name == "org.freedesktop.DBus.Error.Timeout")
        return 0x08;
    if (name == "org.freedesktop.DBus.Error.UnknownObject" ||
        name == "org.freedesktop.DBus.Error.UnknownMethod" ||
        name == "org.bluez.Error.DoesNotExist")
        return 0x02;  // unknown connection identifier
    if (name == "org.bluez.Error.NotReady")
        return 0x16;
    return 0x3E;  // connection failed to be established
}

#if GATTLINK_HAVE_SDBUS
[[maybe_unused]] static inline int read_var_s(sd_bus_message *m, std::string &out)
{
    // read variant "s"
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "s");
    if (r < 0)
        return r;
    const char *s = nullptr;
    r             = sd_bus_message_read(m, "s", &s);
    if (r >= 0 && s)
        out = s;
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_o(sd_bus_message *m, std::string &out)
{
    // read variant "o"
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "o");
    if (r < 0)
        return r;
    const char *s = nullptr;
    r             = sd_bus_message_read(m, "o", &s);
    if (r >= 0 && s)
        out = s;
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_b(sd_bus_message *m, bool &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "b");
    if (r < 0)
        return r;
    int b = 0;
    r     = sd_bus_message_read(m, "b", &b);
    if (r >= 0)
        out = (b != 0);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_i16(sd_bus_message *m, int16_t &out)
{
    // read variant "n" (int16)
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "n");
    if (r < 0)
        return r;
    r      = sd_bus_message_read(m, "n", &out);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_u16(sd_bus_message *m, uint16_t &out)
{
    // read variant "q" (uint16)
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "q");
    if (r < 0)
        return r;
    r      = sd_bus_message_read(m, "q", &out);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_bytes(sd_bus_message *m, Bytes &out)
{
    // read variant "ay"
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "ay");
    if (r < 0)
        return r;
    const void *buf = nullptr;
    size_t      len = 0;
    r               = sd_bus_message_read_array(m, 'y', &buf, &len);
    if (r >= 0)
    {
        const auto *p = static_cast<const uint8_t *>(buf);
        out.assign(p, p + len);
    }
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_flags(sd_bus_message *m, std::uint32_t &out)
{
    // read variant "as" of GATT flags into property bits
    out   = 0;
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "as");
    if (r < 0)
        return r;
    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "s");
    if (r < 0)
        return r;
    while (true)
    {
        const char *f  = nullptr;
        int         rr = sd_bus_message_read_basic(m, 's', &f);
        if (rr <= 0)
            break;
        if (f)
            out |= flag_to_property(f);
    }
    int r1 = sd_bus_message_exit_container(m);
    int r2 = sd_bus_message_exit_container(m);
    return (r1 < 0 || r2 < 0) ? -EBADMSG : 0;
}
#endif

}  // namespace adapter
