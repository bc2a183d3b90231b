#include <gtest/gtest.h>

#include "adapter/bluez_adapter.hpp"
#include "adapter/bluez_dbus_util.hpp"
#include "session/peripheral.hpp"
#include "session/state.hpp"

using namespace adapter;

TEST(BluezUtil, DevicePath)
{
    EXPECT_EQ(device_path("/org/bluez/hci0", "aa:bb:cc:dd:ee:0f"),
              "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_0F");
}

TEST(BluezUtil, PathUnder)
{
    const std::string dev = "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF";
    EXPECT_TRUE(path_under(dev, dev));
    EXPECT_TRUE(path_under(dev + "/service000c/char000d", dev));
    EXPECT_FALSE(path_under(dev + "0/service000c", dev));  // other device sharing a prefix
    EXPECT_FALSE(path_under("/org/bluez/hci1/dev_AA_BB_CC_DD_EE_FF", dev));
    EXPECT_FALSE(path_under(dev, ""));
}

TEST(BluezUtil, FlagsToProperties)
{
    EXPECT_EQ(flag_to_property("read"), props::Read);
    EXPECT_EQ(flag_to_property("write-without-response"), props::WriteWithoutResponse);
    EXPECT_EQ(flag_to_property("write"), props::Write);
    EXPECT_EQ(flag_to_property("notify"), props::Notify);
    EXPECT_EQ(flag_to_property("indicate"), props::Indicate);
    EXPECT_EQ(flag_to_property("authenticated-signed-writes"), props::SignedWrite);
    EXPECT_EQ(flag_to_property("reliable-write"), 0u);
}

// Whatever BlueZ reports must decode into the reasons sessions act on.
TEST(BluezUtil, DisconnectReasonsDecode)
{
    using session::DisconnectReason;
    using session::decode_disconnect_code;

    EXPECT_FALSE(decode_disconnect_code(hci_status_for_reason("org.bluez.Reason.Local")));
    EXPECT_EQ(decode_disconnect_code(hci_status_for_reason("org.bluez.Reason.Timeout"))->reason,
              DisconnectReason::Timeout);
    EXPECT_EQ(decode_disconnect_code(hci_status_for_reason("org.bluez.Reason.Remote"))->reason,
              DisconnectReason::Normal);
    EXPECT_EQ(decode_disconnect_code(hci_status_for_reason("org.bluez.Reason.Suspend"))->reason,
              DisconnectReason::Cancelled);
    EXPECT_EQ(decode_disconnect_code(hci_status_for_reason("org.bluez.Reason.Unknown"))->reason,
              DisconnectReason::Unknown);
}

TEST(BluezUtil, ConnectErrorsDecode)
{
    using session::DisconnectReason;
    using session::decode_disconnect_code;

    EXPECT_EQ(decode_disconnect_code(hci_status_for_connect_error("org.freedesktop.DBus.Error.NoReply"))
                  ->reason,
              DisconnectReason::Timeout);
    EXPECT_EQ(decode_disconnect_code(hci_status_for_connect_error("org.bluez.Error.DoesNotExist"))
                  ->reason,
              DisconnectReason::UnknownDevice);
    EXPECT_EQ(decode_disconnect_code(hci_status_for_connect_error("org.bluez.Error.Failed"))->reason,
              DisconnectReason::Failed);
}

// Without a started bus the adapter refuses every command and reports no power.
TEST(BluezAdapterIdle, RefusesCommands)
{
    BluezAdapter      a(BluezConfig{});
    const std::string mac = "AA:BB:CC:DD:EE:FF";

    EXPECT_EQ(a.config().adapter, "hci0");
    EXPECT_NE(a.power_state(), PowerState::PoweredOn);
    EXPECT_LT(a.connect(mac), 0);
    EXPECT_LT(a.read_rssi(mac), 0);
    EXPECT_TRUE(a.services(mac).empty());

    session::Peripheral p(a, mac);
    EXPECT_EQ(p.connect().code, session::Errc::AdapterDisabled);
}
