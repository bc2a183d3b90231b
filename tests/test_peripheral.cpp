#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <thread>
#include <vector>

#include "adapter/fake_adapter.hpp"
#include "session/peripheral.hpp"

using namespace std::chrono_literals;
using adapter::FakeAdapter;
using adapter::PowerState;
using session::ConnectPhase;
using session::DisconnectReason;
using session::DisconnectStatus;
using session::Errc;
using session::Peripheral;
using session::PeripheralOptions;
using session::State;
using session::Status;
namespace props = adapter::props;

namespace
{
const adapter::DeviceId kDev = "AA:BB:CC:DD:EE:FF";

const char *kBatterySvc  = "0000180f-0000-1000-8000-00805f9b34fb";
const char *kBatteryChr  = "00002a19-0000-1000-8000-00805f9b34fb";
const char *kCccd        = "00002902-0000-1000-8000-00805f9b34fb";
const char *kUartSvc     = "6e400001-b5a3-f393-e0a9-e50e24dcca9e";
const char *kUartTx      = "6e400002-b5a3-f393-e0a9-e50e24dcca9e";
const char *kUartRx      = "6e400003-b5a3-f393-e0a9-e50e24dcca9e";
const char *kBatteryPath = "/dev/service000c/char000d";
const char *kCccdPath    = "/dev/service000c/char000d/desc000f";
const char *kTxPath      = "/dev/service0020/char0021";
const char *kRxPath      = "/dev/service0020/char0023";

const gatt::CharacteristicRef kBattery{"180f", "2a19"};
const gatt::CharacteristicRef kTx{kUartSvc, kUartTx};
const gatt::CharacteristicRef kRx{kUartSvc, kUartRx};

void populate(FakeAdapter &fake)
{
    adapter::NativeService battery{kBatterySvc, "/dev/service000c", {}};
    battery.characteristics.push_back(adapter::NativeCharacteristic{
        kBatteryChr, kBatteryPath, props::Read | props::Notify, {{kCccd, kCccdPath}}});

    adapter::NativeService uart{kUartSvc, "/dev/service0020", {}};
    uart.characteristics.push_back(adapter::NativeCharacteristic{
        kUartTx, kTxPath, props::Write | props::WriteWithoutResponse, {}});
    uart.characteristics.push_back(
        adapter::NativeCharacteristic{kUartRx, kRxPath, props::Notify, {}});

    fake.set_services(kDev, {battery, uart});
    fake.set_device_name(kDev, "sensor");
    fake.set_characteristic_value(kBatteryPath, {0x64});
}

bool wait_for_state(Peripheral &p, ConnectPhase phase)
{
    for (int i = 0; i < 200; ++i)
    {
        if (p.state().is_connecting(phase))
            return true;
        std::this_thread::sleep_for(10ms);
    }
    return false;
}

struct PeripheralTest : ::testing::Test
{
    FakeAdapter fake;
    PeripheralTest() { populate(fake); }
};
}  // namespace

TEST_F(PeripheralTest, ConnectWalksPhasesAndPublishesCatalog)
{
    int               mtu = 0;
    PeripheralOptions opts;
    opts.on_mtu_changed = [&](int m) { mtu = m; };
    Peripheral p(fake, kDev, std::move(opts));

    std::vector<State> seen;
    auto               l = p.state_signal().listen([&](const State &s) { seen.push_back(s); });

    EXPECT_FALSE(p.services().has_value());
    Status st = p.connect();
    ASSERT_TRUE(st) << session::to_string(st);
    EXPECT_TRUE(p.state().is_connected());
    l.reset();

    const std::vector<State> want = {State::disconnected(),
                                     State::connecting(ConnectPhase::LinkEstablishing),
                                     State::connecting(ConnectPhase::DiscoveringServices),
                                     State::connecting(ConnectPhase::ConfiguringObservations),
                                     State::connected()};
    EXPECT_EQ(seen, want);
    EXPECT_EQ(mtu, 185);

    auto services = p.services();
    ASSERT_TRUE(services.has_value());
    ASSERT_EQ(services->size(), 2u);
    EXPECT_EQ((*services)[0].uuid, kBatterySvc);
    EXPECT_EQ((*services)[0].characteristics[0].descriptors.size(), 1u);
    EXPECT_EQ(p.name(), "sensor");
}

TEST_F(PeripheralTest, ConnectWhenConnectedIsNoop)
{
    Peripheral p(fake, kDev);
    ASSERT_TRUE(p.connect());
    ASSERT_TRUE(p.connect());
    EXPECT_EQ(fake.calls("connect"), 1);
}

TEST_F(PeripheralTest, ConcurrentConnectsShareOneAttempt)
{
    fake.set_response_delay(20ms);
    Peripheral p(fake, kDev);

    std::atomic<int>         ok{0};
    std::vector<std::thread> callers;
    for (int i = 0; i < 3; ++i)
    {
        callers.emplace_back([&] {
            if (p.connect())
                ++ok;
        });
    }
    for (auto &t : callers)
        t.join();

    EXPECT_EQ(ok.load(), 3);
    EXPECT_EQ(fake.calls("connect"), 1);
}

TEST_F(PeripheralTest, DisconnectThenReconnect)
{
    Peripheral p(fake, kDev);
    ASSERT_TRUE(p.connect());
    ASSERT_TRUE(p.disconnect());
    EXPECT_TRUE(p.state().is_disconnected());
    EXPECT_FALSE(p.services().has_value());

    ASSERT_TRUE(p.connect());
    EXPECT_TRUE(p.state().is_connected());
    EXPECT_EQ(fake.calls("connect"), 2);
    EXPECT_EQ(fake.calls("cancel_connection"), 1);
}

TEST_F(PeripheralTest, DisconnectWhenIdleIsImmediate)
{
    Peripheral p(fake, kDev);
    EXPECT_TRUE(p.disconnect());
    EXPECT_EQ(p.state(), State::disconnected());
}

TEST_F(PeripheralTest, AtMostOneOperationInFlight)
{
    fake.set_response_delay(5ms);
    Peripheral p(fake, kDev);
    ASSERT_TRUE(p.connect());

    std::vector<std::thread> callers;
    std::atomic<int>         ok{0};
    for (int i = 0; i < 3; ++i)
    {
        callers.emplace_back([&] {
            adapter::Bytes out;
            if (p.read(kBattery, out))
                ++ok;
        });
        callers.emplace_back([&] {
            int rssi = 0;
            if (p.rssi(rssi))
                ++ok;
        });
        callers.emplace_back([&] {
            if (p.write(kTx, {0x01}))
                ++ok;
        });
    }
    for (auto &t : callers)
        t.join();

    EXPECT_EQ(ok.load(), 9);
    EXPECT_EQ(fake.max_inflight(), 1);
}

TEST_F(PeripheralTest, ReadAndWrite)
{
    Peripheral p(fake, kDev);
    ASSERT_TRUE(p.connect());

    adapter::Bytes out;
    ASSERT_TRUE(p.read(kBattery, out));
    EXPECT_EQ(out, (adapter::Bytes{0x64}));

    ASSERT_TRUE(p.write(kTx, {0xAB, 0xCD}));
    ASSERT_EQ(fake.writes(kTxPath).size(), 1u);
    EXPECT_EQ(fake.writes(kTxPath)[0], (adapter::Bytes{0xAB, 0xCD}));

    fake.inject("write_characteristic", FakeAdapter::Fault::Error, -5);
    Status st = p.write(kTx, {0x00});
    EXPECT_EQ(st.code, Errc::IOFailure);
    EXPECT_TRUE(p.state().is_connected());
}

TEST_F(PeripheralTest, ReadWithoutReadPropertyNeverReachesStack)
{
    Peripheral p(fake, kDev);
    ASSERT_TRUE(p.connect());

    adapter::Bytes out;
    Status         st = p.read(kRx, out);
    EXPECT_EQ(st.code, Errc::CapabilityMissing);
    EXPECT_EQ(fake.calls("read_characteristic"), 0);

    st = p.write(kBattery, {0x01});
    EXPECT_EQ(st.code, Errc::CapabilityMissing);
    EXPECT_EQ(fake.calls("write_characteristic"), 0);

    st = p.read(gatt::CharacteristicRef{"180f", "2a1a"}, out);
    EXPECT_EQ(st.code, Errc::NotFound);
}

TEST_F(PeripheralTest, OperationsNeedAConnection)
{
    Peripheral     p(fake, kDev);
    adapter::Bytes out;
    int            rssi = 0;
    EXPECT_EQ(p.rssi(rssi).code, Errc::NotReady);
    EXPECT_EQ(p.read(kBattery, out).code, Errc::NotReady);
    EXPECT_EQ(p.write(kTx, {0x01}).code, Errc::NotReady);
    EXPECT_EQ(fake.calls("read_rssi"), 0);
}

TEST_F(PeripheralTest, Rssi)
{
    fake.set_rssi(-42);
    Peripheral p(fake, kDev);
    ASSERT_TRUE(p.connect());
    int rssi = 0;
    ASSERT_TRUE(p.rssi(rssi));
    EXPECT_EQ(rssi, -42);
}

TEST_F(PeripheralTest, WriteWithoutResponseWaitsUntilReady)
{
    Peripheral p(fake, kDev);
    ASSERT_TRUE(p.connect());
    fake.set_write_ready(kDev, false);

    Status      st;
    std::thread th([&] { st = p.write(kTx, {0x42}, adapter::WriteType::WithoutResponse); });
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(fake.calls("write_without_response"), 0);

    fake.set_write_ready(kDev, true);
    th.join();
    ASSERT_TRUE(st) << session::to_string(st);
    EXPECT_EQ(fake.calls("write_without_response"), 1);
    EXPECT_EQ(fake.writes(kTxPath).back(), (adapter::Bytes{0x42}));
}

TEST_F(PeripheralTest, Descriptors)
{
    adapter::NativeValue cccd;
    cccd.type   = adapter::NativeValue::Type::Number;
    cccd.number = 1;
    fake.set_descriptor_value(kCccdPath, cccd);

    Peripheral p(fake, kDev);
    ASSERT_TRUE(p.connect());

    const gatt::DescriptorRef ref{"180f", "2a19", "2902"};
    adapter::Bytes            out;
    ASSERT_TRUE(p.read(ref, out));
    EXPECT_EQ(out, (adapter::Bytes{0x01, 0x00}));

    ASSERT_TRUE(p.write(ref, {0x00, 0x00}));
    ASSERT_EQ(fake.writes(kCccdPath).size(), 1u);

    EXPECT_EQ(p.read(gatt::DescriptorRef{"180f", "2a19", "2901"}, out).code, Errc::NotFound);
}

TEST_F(PeripheralTest, AdapterOffFailsFast)
{
    fake.set_power_state(PowerState::PoweredOff);
    Peripheral p(fake, kDev);
    Status     st = p.connect();
    EXPECT_EQ(st.code, Errc::AdapterDisabled);
    EXPECT_EQ(fake.calls("connect"), 0);
    EXPECT_TRUE(p.state().is_disconnected());
}

TEST_F(PeripheralTest, AdapterLossWhileConnecting)
{
    fake.inject("connect", FakeAdapter::Fault::Drop);
    Peripheral p(fake, kDev);

    Status      st;
    std::thread th([&] { st = p.connect(); });
    ASSERT_TRUE(wait_for_state(p, ConnectPhase::LinkEstablishing));
    fake.set_power_state(PowerState::PoweredOff);
    th.join();

    EXPECT_EQ(st.code, Errc::AdapterUnavailable);
    EXPECT_TRUE(p.state().is_disconnected());
    EXPECT_EQ(fake.calls("cancel_connection"), 1);
}

TEST_F(PeripheralTest, ConnectFailureCarriesReason)
{
    fake.inject("connect", FakeAdapter::Fault::Error, 0x09);
    Peripheral p(fake, kDev);

    Status st = p.connect();
    EXPECT_EQ(st.code, Errc::ConnectionLost);
    ASSERT_TRUE(st.reason.has_value());
    EXPECT_EQ(*st.reason, (DisconnectStatus{DisconnectReason::ConnectionLimitReached, 0x09}));
    EXPECT_EQ(p.state(), State::disconnected(DisconnectStatus{DisconnectReason::ConnectionLimitReached, 0x09}));
}

TEST_F(PeripheralTest, LinkLossDuringDiscovery)
{
    fake.inject("discover_characteristics", FakeAdapter::Fault::Disconnect, 0x08);
    Peripheral p(fake, kDev);

    Status st = p.connect();
    EXPECT_EQ(st.code, Errc::ConnectionLost);
    ASSERT_TRUE(st.reason.has_value());
    EXPECT_EQ(st.reason->reason, DisconnectReason::Timeout);
    EXPECT_FALSE(p.services().has_value());
    EXPECT_EQ(p.state(), State::disconnected(DisconnectStatus{DisconnectReason::Timeout, 0x08}));

    // the next attempt starts from scratch
    ASSERT_TRUE(p.connect());
    EXPECT_TRUE(p.services().has_value());
}

// The stack confirms teardowns late; a retry must not be hit by the old link going down.
TEST_F(PeripheralTest, RetryAfterFailedConnectWithLateTeardown)
{
    fake.set_response_delay(20ms);
    fake.inject("discover_services", FakeAdapter::Fault::Error, 0x85);
    Peripheral p(fake, kDev);

    Status st = p.connect();
    EXPECT_EQ(st.code, Errc::IOFailure);
    EXPECT_TRUE(p.state().is_disconnected());

    st = p.connect();
    ASSERT_TRUE(st) << session::to_string(st);
    EXPECT_TRUE(p.state().is_connected());
    EXPECT_EQ(fake.calls("connect"), 2);

    ASSERT_TRUE(p.disconnect());
    st = p.connect();
    ASSERT_TRUE(st) << session::to_string(st);
    EXPECT_TRUE(p.state().is_connected());
    ASSERT_TRUE(p.disconnect());
}

TEST_F(PeripheralTest, LinkLossWhileConnected)
{
    Peripheral p(fake, kDev);
    ASSERT_TRUE(p.connect());

    fake.drop_link(kDev, 0x13);
    EXPECT_EQ(p.state(), State::disconnected(DisconnectStatus{DisconnectReason::Normal, 0x13}));
    EXPECT_FALSE(p.services().has_value());

    adapter::Bytes out;
    EXPECT_EQ(p.read(kBattery, out).code, Errc::NotReady);
}

TEST_F(PeripheralTest, CancelledCallerLeavesAttemptRunning)
{
    fake.inject("connect", FakeAdapter::Fault::Drop);
    Peripheral p(fake, kDev);

    gattlink::CancelSource src;
    Status                 mine, other;
    std::thread            a([&] { mine = p.connect(src.token()); });
    ASSERT_TRUE(wait_for_state(p, ConnectPhase::LinkEstablishing));
    std::thread b([&] { other = p.connect(); });
    std::this_thread::sleep_for(50ms);  // b joins the attempt in flight

    src.cancel();
    a.join();
    EXPECT_EQ(mine.code, Errc::Cancelled);
    EXPECT_TRUE(p.state().is_connecting(ConnectPhase::LinkEstablishing));

    ASSERT_TRUE(p.disconnect());
    b.join();
    EXPECT_EQ(other.code, Errc::ConnectionLost);
    EXPECT_TRUE(p.state().is_disconnected());
    EXPECT_EQ(fake.calls("connect"), 1);
}

TEST_F(PeripheralTest, ServiceFilterLimitsCatalog)
{
    PeripheralOptions opts;
    opts.service_filter = {kUartSvc};
    Peripheral p(fake, kDev, std::move(opts));
    ASSERT_TRUE(p.connect());

    auto services = p.services();
    ASSERT_TRUE(services.has_value());
    ASSERT_EQ(services->size(), 1u);
    EXPECT_EQ((*services)[0].uuid, kUartSvc);
}

TEST_F(PeripheralTest, ServicesDiscoveredHookCanFailConnect)
{
    int               runs = 0;
    PeripheralOptions opts;
    opts.on_services_discovered = [&](Peripheral &self, const gattlink::CancelToken &tok) {
        ++runs;
        adapter::Bytes out;
        Status         st = self.read(kBattery, out, tok);
        if (!st)
            return st;
        return out == adapter::Bytes{0x64} ? Status::error(Errc::NotFound, "unexpected battery")
                                           : Status::success();
    };
    Peripheral p(fake, kDev, std::move(opts));

    Status st = p.connect();
    EXPECT_EQ(runs, 1);
    EXPECT_EQ(st.code, Errc::NotFound);
    EXPECT_TRUE(p.state().is_disconnected());
    EXPECT_FALSE(fake.linked(kDev));
}

TEST_F(PeripheralTest, ObserveAcrossDisconnect)
{
    Peripheral p(fake, kDev);

    std::unique_ptr<gatt::Subscription> sub;
    ASSERT_TRUE(p.observe(kBattery, sub));
    EXPECT_EQ(fake.calls("start_notify"), 0);  // armed on connect

    ASSERT_TRUE(p.connect());
    EXPECT_TRUE(fake.notifying(kBatteryPath));

    fake.emit_value(kDev, kBatteryPath, {0x01});
    fake.drop_link(kDev, 0x08);

    gatt::ObservationEvent ev;
    ASSERT_TRUE(sub->next_for(ev, 1s));
    EXPECT_EQ(ev.type, gatt::ObservationEvent::Type::Value);
    EXPECT_EQ(ev.value, (adapter::Bytes{0x01}));
    ASSERT_TRUE(sub->next_for(ev, 1s));
    EXPECT_EQ(ev.type, gatt::ObservationEvent::Type::Disconnected);

    // survives the reconnect
    ASSERT_TRUE(p.connect());
    EXPECT_EQ(fake.calls("start_notify"), 2);
    fake.emit_value(kDev, kBatteryPath, {0x02});
    ASSERT_TRUE(sub->next_for(ev, 1s));
    EXPECT_EQ(ev.value, (adapter::Bytes{0x02}));
}

TEST_F(PeripheralTest, ObserveWhileConnectedArmsOnceAndReleases)
{
    Peripheral p(fake, kDev);
    ASSERT_TRUE(p.connect());

    std::unique_ptr<gatt::Subscription> a, b;
    int                                 primed = 0;
    ASSERT_TRUE(p.observe(kBattery, a, [&](const gattlink::CancelToken &) {
        ++primed;
        return Status::success();
    }));
    ASSERT_TRUE(p.observe(kBattery, b));
    EXPECT_EQ(fake.calls("start_notify"), 1);
    EXPECT_EQ(primed, 1);

    // a read result reaches observers too
    adapter::Bytes out;
    ASSERT_TRUE(p.read(kBattery, out));
    gatt::ObservationEvent ev;
    ASSERT_TRUE(b->next_for(ev, 1s));
    EXPECT_EQ(ev.value, (adapter::Bytes{0x64}));

    a.reset();
    EXPECT_TRUE(fake.notifying(kBatteryPath));
    b.reset();
    EXPECT_FALSE(fake.notifying(kBatteryPath));
    EXPECT_EQ(fake.calls("stop_notify"), 1);
}

TEST_F(PeripheralTest, ObserveRequiresNotifyProperty)
{
    Peripheral p(fake, kDev);
    ASSERT_TRUE(p.connect());

    std::unique_ptr<gatt::Subscription> sub;
    Status                              st = p.observe(kTx, sub);
    EXPECT_EQ(st.code, Errc::CapabilityMissing);
    EXPECT_FALSE(sub);
}

TEST_F(PeripheralTest, ObservationErrorHandler)
{
    // default: a failed re-arm fails the attempt
    {
        Peripheral                          p(fake, kDev);
        std::unique_ptr<gatt::Subscription> sub;
        ASSERT_TRUE(p.observe(kRx, sub));
        fake.inject("start_notify", FakeAdapter::Fault::Error, -5);
        EXPECT_EQ(p.connect().code, Errc::IOFailure);
        EXPECT_TRUE(p.state().is_disconnected());
    }

    // handler that tolerates the failure
    int               handled = 0;
    PeripheralOptions opts;
    opts.on_observation_error = [&](const gatt::CharacteristicRef &, const Status &) {
        ++handled;
        return Status::success();
    };
    Peripheral                          p(fake, kDev, std::move(opts));
    std::unique_ptr<gatt::Subscription> sub;
    ASSERT_TRUE(p.observe(kRx, sub));
    fake.inject("start_notify", FakeAdapter::Fault::Error, -5);
    EXPECT_TRUE(p.connect());
    EXPECT_EQ(handled, 1);
}

TEST_F(PeripheralTest, DestructionClosesSubscriptions)
{
    std::unique_ptr<gatt::Subscription> sub;
    {
        Peripheral p(fake, kDev);
        ASSERT_TRUE(p.connect());
        ASSERT_TRUE(p.observe(kBattery, sub));
    }
    EXPECT_FALSE(fake.linked(kDev));
    gatt::ObservationEvent ev;
    Status                 st = sub->next(ev, {});
    // the link drop comes first, then the closed registry
    if (st)
    {
        EXPECT_EQ(ev.type, gatt::ObservationEvent::Type::Disconnected);
        st = sub->next(ev, {});
    }
    EXPECT_EQ(st.code, Errc::NotReady);
}
