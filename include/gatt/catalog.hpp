#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "adapter/native_adapter.hpp"
#include "session/error.hpp"

/*
Catalog: read-only index of what discovery found, built in one go from the native tree.

  service uuid ──┬── characteristic uuid (+ properties, native handle)
                 │        └── descriptor uuid (+ native handle)
                 └── ...

Lookups take logical references (UUID strings, any case, 16/32-bit short forms allowed) and
resolve them to native handles, checking the property the operation needs.
*/

namespace gatt
{

// Canonical lower-case 128-bit form. "180d" and "0000180d" expand with the SIG base UUID.
// Returns "" when the input is not a UUID.
std::string normalize_uuid(const std::string &uuid);

struct CharacteristicRef
{
    std::string service_uuid;
    std::string characteristic_uuid;
};

struct DescriptorRef
{
    std::string service_uuid;
    std::string characteristic_uuid;
    std::string descriptor_uuid;
};

bool operator==(const CharacteristicRef &a, const CharacteristicRef &b);

// "service/characteristic" in canonical form, for keyed lookups
std::string canonical_key(const CharacteristicRef &ref);

struct DiscoveredDescriptor
{
    std::string     uuid;
    adapter::Handle handle;
};

struct DiscoveredCharacteristic
{
    std::string                       service_uuid;
    std::string                       uuid;
    adapter::Handle                   handle;
    std::uint32_t                     properties = 0;
    std::vector<DiscoveredDescriptor> descriptors;

    CharacteristicRef ref() const { return CharacteristicRef{service_uuid, uuid}; }
};

struct DiscoveredService
{
    std::string                           uuid;
    adapter::Handle                       handle;
    std::vector<DiscoveredCharacteristic> characteristics;
};

class Catalog
{
  public:
    explicit Catalog(const std::vector<adapter::NativeService> &tree);

    const std::vector<DiscoveredService> &services() const { return services_; }

    // First characteristic matching ref with any of required_any set (0 = no requirement).
    // NotFound when nothing matches the UUIDs, CapabilityMissing when matches lack the property.
    session::Status obtain(const CharacteristicRef         &ref,
                           std::uint32_t                    required_any,
                           const DiscoveredCharacteristic *&out) const;

    session::Status obtain(const DescriptorRef &ref, const DiscoveredDescriptor *&out) const;

    // Used to route value updates; nullptr for unknown handles.
    const DiscoveredCharacteristic *find_by_handle(const adapter::Handle &h) const;

  private:
    std::vector<DiscoveredService>                           services_;
    std::unordered_map<adapter::Handle, std::pair<std::size_t, std::size_t>> by_handle_;
};

std::string to_string(const CharacteristicRef &ref);
std::string to_string(const DescriptorRef &ref);
// "read|write|notify"
std::string properties_to_string(std::uint32_t props);

}  // namespace gatt
