#include <gtest/gtest.h>

#include "session/error.hpp"
#include "session/state.hpp"

using namespace session;

TEST(DisconnectCode, ZeroMeansNoError)
{
    EXPECT_FALSE(decode_disconnect_code(0).has_value());
}

TEST(DisconnectCode, DecodesKnownCodes)
{
    struct Row
    {
        int              code;
        DisconnectReason want;
    };
    const Row rows[] = {
        // clang-format off
        {0x13, DisconnectReason::Normal},
        {0x14, DisconnectReason::Normal},
        {0x15, DisconnectReason::Normal},
        {0x08, DisconnectReason::Timeout},
        {0x22, DisconnectReason::Timeout},
        {0x09, DisconnectReason::ConnectionLimitReached},
        {0x3D, DisconnectReason::EncryptionTimedOut},
        {0x02, DisconnectReason::UnknownDevice},
        {0x16, DisconnectReason::Cancelled},
        {0x3E, DisconnectReason::Failed},
        // clang-format on
    };
    for (const auto &r : rows)
    {
        auto got = decode_disconnect_code(r.code);
        ASSERT_TRUE(got.has_value()) << "code " << r.code;
        EXPECT_EQ(got->reason, r.want) << "code " << r.code;
        EXPECT_EQ(got->code, r.code);
    }
}

TEST(DisconnectCode, UnknownKeepsRawCode)
{
    auto got = decode_disconnect_code(0x3B);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->reason, DisconnectReason::Unknown);
    EXPECT_EQ(got->code, 0x3B);
    EXPECT_EQ(to_string(*got), "unknown-code(59)");
}

TEST(DisconnectStatusEq, DecodedReasonsIgnoreCode)
{
    // 0x13 and 0x15 are both a clean remote close
    EXPECT_EQ(*decode_disconnect_code(0x13), *decode_disconnect_code(0x15));
    EXPECT_EQ(*decode_disconnect_code(0x08), *decode_disconnect_code(0x22));
    EXPECT_NE(*decode_disconnect_code(0x08), *decode_disconnect_code(0x13));
}

TEST(DisconnectStatusEq, UnknownComparesByCode)
{
    EXPECT_EQ(*decode_disconnect_code(0x3B), *decode_disconnect_code(0x3B));
    EXPECT_NE(*decode_disconnect_code(0x3B), *decode_disconnect_code(0x3C));
}

TEST(StateEq, ComparesPhaseAndStatus)
{
    EXPECT_EQ(State::connecting(ConnectPhase::LinkEstablishing),
              State::connecting(ConnectPhase::LinkEstablishing));
    EXPECT_NE(State::connecting(ConnectPhase::LinkEstablishing),
              State::connecting(ConnectPhase::DiscoveringServices));
    EXPECT_EQ(State::connected(), State::connected());
    EXPECT_NE(State::connected(), State::disconnecting());

    EXPECT_EQ(State::disconnected(), State::disconnected());
    EXPECT_NE(State::disconnected(), State::disconnected(decode_disconnect_code(0x08)));
    EXPECT_EQ(State::disconnected(decode_disconnect_code(0x09)),
              State::disconnected(DisconnectStatus{DisconnectReason::ConnectionLimitReached, 0x09}));
}

TEST(StateText, Readable)
{
    EXPECT_EQ(to_string(State::disconnected()), "Disconnected");
    EXPECT_EQ(to_string(State::connecting(ConnectPhase::DiscoveringServices)),
              "Connecting{DiscoveringServices}");
    EXPECT_EQ(to_string(State::disconnected(decode_disconnect_code(0x08))),
              "Disconnected{timeout(0x08)}");
}

TEST(StatusText, IncludesReasonOrNativeCode)
{
    EXPECT_TRUE(Status::success());
    EXPECT_EQ(to_string(Status::success()), "Ok");

    Status io = Status::io_failure(-5, "WriteValue failed");
    EXPECT_FALSE(io);
    EXPECT_EQ(to_string(io), "IOFailure: WriteValue failed (native=-5)");

    Status lost = Status::connection_lost(decode_disconnect_code(0x08), "gone");
    EXPECT_EQ(lost.code, Errc::ConnectionLost);
    EXPECT_EQ(lost.native_code, 0x08);
    EXPECT_EQ(to_string(lost), "ConnectionLost: gone [timeout(0x08)]");

    EXPECT_EQ(Status::cancelled().code, Errc::Cancelled);
}
