#include <gtest/gtest.h>

#include "gatt/catalog.hpp"

using namespace gatt;
namespace props = adapter::props;

namespace
{
const char *kHeartRate  = "0000180d-0000-1000-8000-00805f9b34fb";
const char *kMeasure    = "00002a37-0000-1000-8000-00805f9b34fb";
const char *kLocation   = "00002a38-0000-1000-8000-00805f9b34fb";
const char *kCccd       = "00002902-0000-1000-8000-00805f9b34fb";
const char *kVendorSvc  = "6E400001-B5A3-F393-E0A9-E50E24DCCA9E";
const char *kVendorChar = "6E400002-B5A3-F393-E0A9-E50E24DCCA9E";

std::vector<adapter::NativeService> tree()
{
    using adapter::NativeCharacteristic;
    adapter::NativeService hr{kHeartRate, "/svc1", {}};
    hr.characteristics.push_back(
        NativeCharacteristic{kMeasure, "/svc1/chr1", props::Notify, {{kCccd, "/svc1/chr1/d1"}}});
    hr.characteristics.push_back(NativeCharacteristic{kLocation, "/svc1/chr2", props::Read, {}});

    adapter::NativeService vendor{kVendorSvc, "/svc2", {}};
    // same UUID twice: the first one lacks write-without-response
    vendor.characteristics.push_back(NativeCharacteristic{kVendorChar, "/svc2/chr1", props::Write, {}});
    vendor.characteristics.push_back(
        NativeCharacteristic{kVendorChar, "/svc2/chr2", props::WriteWithoutResponse, {}});
    return {hr, vendor};
}
}  // namespace

TEST(Uuid, Normalizes)
{
    EXPECT_EQ(normalize_uuid("180D"), kHeartRate);
    EXPECT_EQ(normalize_uuid("0000180d"), kHeartRate);
    EXPECT_EQ(normalize_uuid(kVendorSvc), "6e400001-b5a3-f393-e0a9-e50e24dcca9e");
    EXPECT_EQ(normalize_uuid("not-a-uuid"), "");
    EXPECT_EQ(normalize_uuid("18g0"), "");
}

TEST(Uuid, RefEqualityIgnoresFormAndCase)
{
    EXPECT_EQ((CharacteristicRef{"180d", "2A37"}), (CharacteristicRef{kHeartRate, kMeasure}));
    EXPECT_FALSE((CharacteristicRef{"180d", "2a37"}) == (CharacteristicRef{"180d", "2a38"}));
}

TEST(Catalog, ObtainsByShortUuid)
{
    Catalog                         cat(tree());
    const DiscoveredCharacteristic *chr = nullptr;
    auto                            st  = cat.obtain(CharacteristicRef{"180d", "2a38"}, props::Read, chr);
    ASSERT_TRUE(st) << session::to_string(st);
    ASSERT_NE(chr, nullptr);
    EXPECT_EQ(chr->handle, "/svc1/chr2");
    EXPECT_EQ(chr->service_uuid, kHeartRate);
}

TEST(Catalog, NotFoundVersusCapabilityMissing)
{
    Catalog                         cat(tree());
    const DiscoveredCharacteristic *chr = nullptr;

    auto st = cat.obtain(CharacteristicRef{"180d", "2a39"}, props::Read, chr);
    EXPECT_EQ(st.code, session::Errc::NotFound);
    EXPECT_EQ(chr, nullptr);

    st = cat.obtain(CharacteristicRef{"180f", "2a37"}, 0, chr);
    EXPECT_EQ(st.code, session::Errc::NotFound);

    st = cat.obtain(CharacteristicRef{"180d", "2a37"}, props::Read, chr);
    EXPECT_EQ(st.code, session::Errc::CapabilityMissing);
    EXPECT_NE(st.message.find("notify"), std::string::npos);
    EXPECT_EQ(chr, nullptr);
}

TEST(Catalog, PicksFirstCapableDuplicate)
{
    Catalog                         cat(tree());
    const DiscoveredCharacteristic *chr = nullptr;
    ASSERT_TRUE(cat.obtain(CharacteristicRef{kVendorSvc, kVendorChar}, props::WriteWithoutResponse, chr));
    EXPECT_EQ(chr->handle, "/svc2/chr2");
    ASSERT_TRUE(cat.obtain(CharacteristicRef{kVendorSvc, kVendorChar}, props::Write, chr));
    EXPECT_EQ(chr->handle, "/svc2/chr1");
}

TEST(Catalog, Descriptors)
{
    Catalog                     cat(tree());
    const DiscoveredDescriptor *d = nullptr;
    ASSERT_TRUE(cat.obtain(DescriptorRef{"180d", "2a37", "2902"}, d));
    EXPECT_EQ(d->handle, "/svc1/chr1/d1");

    EXPECT_EQ(cat.obtain(DescriptorRef{"180d", "2a38", "2902"}, d).code, session::Errc::NotFound);
    EXPECT_EQ(d, nullptr);
}

TEST(Catalog, FindByHandle)
{
    Catalog cat(tree());
    auto   *chr = cat.find_by_handle("/svc1/chr1");
    ASSERT_NE(chr, nullptr);
    EXPECT_EQ(chr->ref(), (CharacteristicRef{"180d", "2a37"}));
    EXPECT_EQ(cat.find_by_handle("/nope"), nullptr);
    EXPECT_EQ(cat.services().size(), 2u);
}

TEST(Catalog, PropertiesText)
{
    EXPECT_EQ(properties_to_string(props::Read | props::Notify), "read|notify");
    EXPECT_EQ(properties_to_string(0), "");
}
