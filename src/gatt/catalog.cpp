#include <algorithm>
#include <cctype>

#include "gatt/catalog.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace gatt
{

namespace
{
bool all_hex(const std::string &s)
{
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

// Compare key: canonical form, or the lower-cased input when it is not a UUID.
std::string key_of(const std::string &uuid)
{
    std::string k = normalize_uuid(uuid);
    if (!k.empty())
        return k;
    std::string low = uuid;
    std::transform(low.begin(), low.end(), low.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return low;
}
}  // namespace

std::string normalize_uuid(const std::string &uuid)
{
    std::string s = uuid;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (s.size() == 4 && all_hex(s))
        return "0000" + s + std::string(constants::BASE_UUID_SUFFIX);
    if (s.size() == 8 && all_hex(s))
        return s + std::string(constants::BASE_UUID_SUFFIX);
    if (s.size() != 36)
        return "";
    for (size_t i = 0; i < s.size(); ++i)
    {
        const bool dash = (i == 8 || i == 13 || i == 18 || i == 23);
        if (dash ? s[i] != '-' : !std::isxdigit(static_cast<unsigned char>(s[i])))
            return "";
    }
    return s;
}

bool operator==(const CharacteristicRef &a, const CharacteristicRef &b)
{
    return key_of(a.service_uuid) == key_of(b.service_uuid) &&
           key_of(a.characteristic_uuid) == key_of(b.characteristic_uuid);
}

std::string canonical_key(const CharacteristicRef &ref)
{
    return key_of(ref.service_uuid) + "/" + key_of(ref.characteristic_uuid);
}

Catalog::Catalog(const std::vector<adapter::NativeService> &tree)
{
    services_.reserve(tree.size());
    for (const auto &ns : tree)
    {
        DiscoveredService svc;
        svc.uuid   = key_of(ns.uuid);
        svc.handle = ns.handle;
        for (const auto &nc : ns.characteristics)
        {
            DiscoveredCharacteristic chr;
            chr.service_uuid = svc.uuid;
            chr.uuid         = key_of(nc.uuid);
            chr.handle       = nc.handle;
            chr.properties   = nc.properties;
            for (const auto &nd : nc.descriptors)
                chr.descriptors.push_back(DiscoveredDescriptor{key_of(nd.uuid), nd.handle});

            by_handle_[chr.handle] = {services_.size(), svc.characteristics.size()};
            svc.characteristics.push_back(std::move(chr));
        }
        services_.push_back(std::move(svc));
    }
    LOG_DEBUG("[CATALOG] %zu services indexed (%zu characteristics)", services_.size(),
              by_handle_.size());
}

session::Status Catalog::obtain(const CharacteristicRef         &ref,
                                std::uint32_t                    required_any,
                                const DiscoveredCharacteristic *&out) const
{
    out                     = nullptr;
    const std::string s_key = key_of(ref.service_uuid);
    const std::string c_key = key_of(ref.characteristic_uuid);
    bool              seen  = false;
    std::uint32_t     had   = 0;

    for (const auto &svc : services_)
    {
        if (svc.uuid != s_key)
            continue;
        for (const auto &chr : svc.characteristics)
        {
            if (chr.uuid != c_key)
                continue;
            seen = true;
            had |= chr.properties;
            if (required_any == 0 || (chr.properties & required_any) != 0)
            {
                out = &chr;
                return session::Status::success();
            }
        }
    }

    if (!seen)
        return session::Status::error(session::Errc::NotFound,
                                      "Characteristic " + to_string(ref) + " not found");
    return session::Status::error(session::Errc::CapabilityMissing,
                                  "Characteristic " + to_string(ref) + " has properties [" +
                                      properties_to_string(had) + "], requires one of [" +
                                      properties_to_string(required_any) + "]");
}

session::Status Catalog::obtain(const DescriptorRef &ref, const DiscoveredDescriptor *&out) const
{
    out                     = nullptr;
    const std::string s_key = key_of(ref.service_uuid);
    const std::string c_key = key_of(ref.characteristic_uuid);
    const std::string d_key = key_of(ref.descriptor_uuid);

    for (const auto &svc : services_)
    {
        if (svc.uuid != s_key)
            continue;
        for (const auto &chr : svc.characteristics)
        {
            if (chr.uuid != c_key)
                continue;
            for (const auto &d : chr.descriptors)
            {
                if (d.uuid == d_key)
                {
                    out = &d;
                    return session::Status::success();
                }
            }
        }
    }
    return session::Status::error(session::Errc::NotFound,
                                  "Descriptor " + to_string(ref) + " not found");
}

const DiscoveredCharacteristic *Catalog::find_by_handle(const adapter::Handle &h) const
{
    auto it = by_handle_.find(h);
    if (it == by_handle_.end())
        return nullptr;
    return &services_[it->second.first].characteristics[it->second.second];
}

std::string to_string(const CharacteristicRef &ref)
{
    return ref.service_uuid + "/" + ref.characteristic_uuid;
}

std::string to_string(const DescriptorRef &ref)
{
    return ref.service_uuid + "/" + ref.characteristic_uuid + "/" + ref.descriptor_uuid;
}

std::string properties_to_string(std::uint32_t props)
{
    namespace p = adapter::props;
    static const std::pair<std::uint32_t, const char *> names[] = {
        {p::Broadcast, "broadcast"},
        {p::Read, "read"},
        {p::WriteWithoutResponse, "write-without-response"},
        {p::Write, "write"},
        {p::Notify, "notify"},
        {p::Indicate, "indicate"},
        {p::SignedWrite, "signed-write"},
        {p::ExtendedProperties, "extended-properties"},
    };
    std::string out;
    for (const auto &n : names)
    {
        if ((props & n.first) == 0)
            continue;
        if (!out.empty())
            out += "|";
        out += n.second;
    }
    return out;
}

}  // namespace gatt
