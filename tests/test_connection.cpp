#include <atomic>
#include <cerrno>
#include <chrono>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <vector>

#include "adapter/fake_adapter.hpp"
#include "session/connection.hpp"

using namespace std::chrono_literals;
using adapter::Event;
using adapter::FakeAdapter;
using adapter::ResponseKind;
using session::Connection;
using session::Errc;
using session::Status;

namespace
{
const adapter::DeviceId kDev = "AA:BB:CC:DD:EE:01";
const adapter::Handle   kChr = "/dev/service0001/char0002";

struct Linked
{
    FakeAdapter fake;
    Linked() { EXPECT_EQ(fake.connect(kDev), 0); }
};
}  // namespace

TEST(Connection, ExecuteReturnsCorrelatedResponse)
{
    Linked     l;
    Connection conn(l.fake, kDev);

    l.fake.set_mtu(247);
    Event ev;
    Status st = conn.execute(ResponseKind::ServicesDiscovered,
                             [&] { return l.fake.discover_services(kDev, {}); }, &ev, {});
    ASSERT_TRUE(st) << session::to_string(st);
    EXPECT_EQ(ev.kind, ResponseKind::ServicesDiscovered);
    EXPECT_EQ(ev.mtu, 247);
}

TEST(Connection, OneOperationInFlight)
{
    Linked l;
    l.fake.set_response_delay(10ms);
    Connection conn(l.fake, kDev);

    std::atomic<int>         ok{0};
    std::vector<std::thread> callers;
    for (int i = 0; i < 4; ++i)
    {
        callers.emplace_back([&] {
            Event ev;
            if (conn.execute(ResponseKind::RssiRead, [&] { return l.fake.read_rssi(kDev); }, &ev, {}))
                ++ok;
        });
    }
    for (auto &t : callers)
        t.join();

    EXPECT_EQ(ok.load(), 4);
    EXPECT_EQ(l.fake.calls("read_rssi"), 4);
    EXPECT_EQ(l.fake.max_inflight(), 1);
}

TEST(Connection, NativeErrorIsIOFailure)
{
    Linked     l;
    Connection conn(l.fake, kDev);

    l.fake.inject("read_rssi", FakeAdapter::Fault::Error, -5);
    Status st = conn.execute(ResponseKind::RssiRead, [&] { return l.fake.read_rssi(kDev); }, nullptr, {});
    EXPECT_EQ(st.code, Errc::IOFailure);
    EXPECT_EQ(st.native_code, -5);

    // submission refused by the stack
    st = conn.execute(ResponseKind::RssiRead, [] { return -ENOTCONN; }, nullptr, {});
    EXPECT_EQ(st.code, Errc::IOFailure);
    EXPECT_EQ(st.native_code, -ENOTCONN);

    // the guard was released both times
    EXPECT_TRUE(conn.execute(ResponseKind::RssiRead, [&] { return l.fake.read_rssi(kDev); }, nullptr, {}));
}

TEST(Connection, LinkLossFailsWaiterAndLaterCalls)
{
    Linked     l;
    Connection conn(l.fake, kDev);

    l.fake.inject("read_rssi", FakeAdapter::Fault::Drop);
    Status      waited;
    std::thread th([&] {
        waited = conn.execute(ResponseKind::RssiRead, [&] { return l.fake.read_rssi(kDev); }, nullptr, {});
    });
    std::this_thread::sleep_for(20ms);
    l.fake.drop_link(kDev, 0x08);
    th.join();

    EXPECT_EQ(waited.code, Errc::ConnectionLost);
    ASSERT_TRUE(waited.reason.has_value());
    EXPECT_EQ(waited.reason->reason, session::DisconnectReason::Timeout);
    EXPECT_TRUE(conn.closed());

    const int before = l.fake.calls("read_rssi");
    Status    st = conn.execute(ResponseKind::RssiRead, [&] { return l.fake.read_rssi(kDev); }, nullptr, {});
    EXPECT_EQ(st.code, Errc::ConnectionLost);
    EXPECT_EQ(l.fake.calls("read_rssi"), before);  // never submitted
}

TEST(Connection, CancelledWaiterReleasesGuard)
{
    Linked     l;
    Connection conn(l.fake, kDev);

    l.fake.inject("read_rssi", FakeAdapter::Fault::Drop);
    gattlink::CancelSource src;
    Status                 waited;
    std::thread            th([&] {
        waited = conn.execute(ResponseKind::RssiRead, [&] { return l.fake.read_rssi(kDev); }, nullptr,
                              src.token());
    });
    std::this_thread::sleep_for(20ms);
    src.cancel();
    th.join();

    EXPECT_EQ(waited.code, Errc::Cancelled);
    EXPECT_FALSE(conn.closed());
    Event ev;
    EXPECT_TRUE(conn.execute(ResponseKind::RssiRead, [&] { return l.fake.read_rssi(kDev); }, &ev, {}));
    EXPECT_EQ(ev.rssi, -60);
}

TEST(Connection, ReadValueWaitsForItsHandle)
{
    Linked     l;
    Connection conn(l.fake, kDev);

    l.fake.set_characteristic_value(kChr, {0x10, 0x20});
    adapter::Bytes out;
    ASSERT_TRUE(conn.read_value(kChr, [&] { return l.fake.read_characteristic(kDev, kChr); }, out, {}));
    EXPECT_EQ(out, (adapter::Bytes{0x10, 0x20}));
}

TEST(Connection, WriteWithoutResponseWaitsForReadiness)
{
    Linked l;
    l.fake.set_write_ready(kDev, false);
    Connection conn(l.fake, kDev);

    const adapter::Bytes payload{0x01, 0x02};
    Status               st;
    std::thread          th([&] {
        st = conn.write_without_response(
            [&] {
                return l.fake.write_characteristic(kDev, kChr, payload,
                                                   adapter::WriteType::WithoutResponse);
            },
            {});
    });
    std::this_thread::sleep_for(30ms);
    EXPECT_TRUE(l.fake.writes(kChr).empty());

    l.fake.set_write_ready(kDev, true);
    th.join();
    ASSERT_TRUE(st) << session::to_string(st);
    ASSERT_EQ(l.fake.writes(kChr).size(), 1u);
    EXPECT_EQ(l.fake.writes(kChr)[0], payload);
}

TEST(Connection, WriteWithoutResponseFailsOnLinkLoss)
{
    Linked l;
    l.fake.set_write_ready(kDev, false);
    Connection conn(l.fake, kDev);

    Status      st;
    std::thread th([&] {
        st = conn.write_without_response(
            [&] {
                return l.fake.write_characteristic(kDev, kChr, {0x01},
                                                   adapter::WriteType::WithoutResponse);
            },
            {});
    });
    std::this_thread::sleep_for(20ms);
    l.fake.drop_link(kDev, 0x13);
    th.join();

    EXPECT_EQ(st.code, Errc::ConnectionLost);
    EXPECT_TRUE(l.fake.writes(kChr).empty());
}

TEST(ConnectionGuard, GrantsInArrivalOrder)
{
    session::Guard g;
    ASSERT_TRUE(g.acquire({}));

    std::mutex               mu;
    std::vector<int>         order;
    std::vector<std::thread> waiters;
    gattlink::CancelSource   quit;
    for (int i = 0; i < 3; ++i)
    {
        // waiter 1 gives up while queued; the others keep their places
        const gattlink::CancelToken tok = i == 1 ? quit.token() : gattlink::CancelToken{};
        waiters.emplace_back([&, i, tok] {
            if (!g.acquire(tok))
                return;
            {
                std::lock_guard<std::mutex> lk(mu);
                order.push_back(i);
            }
            g.release();
        });
        std::this_thread::sleep_for(20ms);
    }
    quit.cancel();
    std::this_thread::sleep_for(20ms);
    g.release();
    for (auto &t : waiters)
        t.join();

    EXPECT_EQ(order, (std::vector<int>{0, 2}));
}
