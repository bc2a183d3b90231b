#include <gtest/gtest.h>

#include "gatt/descriptor_value.hpp"

using adapter::Bytes;
using adapter::NativeValue;
using gatt::normalize_descriptor_value;

namespace
{
NativeValue number(std::uint64_t n)
{
    NativeValue v;
    v.type   = NativeValue::Type::Number;
    v.number = n;
    return v;
}

NativeValue u16(std::uint16_t n)
{
    NativeValue v;
    v.type = NativeValue::Type::UInt16;
    v.u16  = n;
    return v;
}

const char *kPsm = "ABDD3056-28FA-441D-A470-55A75A52553A";
}  // namespace

TEST(DescriptorValue, BytesAndTextPassThrough)
{
    NativeValue raw;
    raw.bytes = {0xde, 0xad};
    EXPECT_EQ(normalize_descriptor_value("2901", raw), (Bytes{0xde, 0xad}));

    NativeValue text;
    text.type = NativeValue::Type::Text;
    text.text = "Temp";
    EXPECT_EQ(normalize_descriptor_value("2901", text), (Bytes{'T', 'e', 'm', 'p'}));
}

TEST(DescriptorValue, ConfigDescriptorsAreTwoBytes)
{
    EXPECT_EQ(normalize_descriptor_value("2902", number(1)), (Bytes{0x01, 0x00}));
    EXPECT_EQ(normalize_descriptor_value("00002903-0000-1000-8000-00805f9b34fb", number(0x0102)),
              (Bytes{0x02, 0x01}));
    EXPECT_EQ(normalize_descriptor_value("2900", number(0x10003)), (Bytes{0x03, 0x00}));
}

TEST(DescriptorValue, OtherNumbersUseEightBytes)
{
    EXPECT_EQ(normalize_descriptor_value("2904", number(0x0201)),
              (Bytes{0x01, 0x02, 0, 0, 0, 0, 0, 0}));
}

TEST(DescriptorValue, UInt16IsLittleEndian)
{
    EXPECT_EQ(normalize_descriptor_value("2902", u16(0x0002)), (Bytes{0x02, 0x00}));
}

// The PSM value is reported either way depending on the stack; both must agree.
TEST(DescriptorValue, PsmNumberAndUInt16Agree)
{
    EXPECT_TRUE(gatt::is_unsigned_short_descriptor(kPsm));
    EXPECT_EQ(normalize_descriptor_value(kPsm, number(0x0081)), (Bytes{0x81, 0x00}));
    EXPECT_EQ(normalize_descriptor_value(kPsm, u16(0x0081)), (Bytes{0x81, 0x00}));
}

TEST(DescriptorValue, UnknownTypeIsEmptyAndWarns)
{
    NativeValue other;
    other.type      = NativeValue::Type::Other;
    other.type_name = "dict";

    testing::internal::CaptureStderr();
    Bytes       got = normalize_descriptor_value("2902", other);
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_TRUE(got.empty());
    EXPECT_NE(err.find("dict"), std::string::npos);
}
