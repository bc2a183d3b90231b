#include <cstdint>

#include "gatt/catalog.hpp"
#include "gatt/descriptor_value.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace gatt
{

namespace
{
adapter::Bytes little_endian(std::uint64_t v, int width)
{
    adapter::Bytes out;
    out.reserve(width);
    for (int i = 0; i < width; ++i)
        out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF));
    return out;
}
}  // namespace

bool is_unsigned_short_descriptor(const std::string &uuid)
{
    const std::string u = normalize_uuid(uuid);
    return u == constants::CHAR_EXTENDED_PROPERTIES || u == constants::CLIENT_CHAR_CONFIG ||
           u == constants::SERVER_CHAR_CONFIG || u == constants::L2CAP_PSM_CHARACTERISTIC;
}

adapter::Bytes normalize_descriptor_value(const std::string          &descriptor_uuid,
                                          const adapter::NativeValue &value)
{
    using Type = adapter::NativeValue::Type;
    switch (value.type)
    {
        case Type::Bytes:
            return value.bytes;
        case Type::Text:
            return adapter::Bytes(value.text.begin(), value.text.end());
        case Type::Number:
            if (is_unsigned_short_descriptor(descriptor_uuid))
                return little_endian(value.number & 0xFFFF, 2);
            return little_endian(value.number, 8);
        case Type::UInt16:
            return little_endian(value.u16, 2);
        case Type::Other:
            break;
    }
    LOG_WARN("Unknown descriptor type '%s' for %s, using empty value",
             value.type_name.empty() ? "?" : value.type_name.c_str(), descriptor_uuid.c_str());
    return {};
}

}  // namespace gatt
