#pragma once
#include <string>

#include "adapter/native_adapter.hpp"

namespace gatt
{

// Descriptors whose numeric value is an unsigned 16-bit quantity: Characteristic Extended
// Properties (2900), Client / Server Characteristic Configuration (2902 / 2903) and the L2CAP
// PSM attribute.
bool is_unsigned_short_descriptor(const std::string &uuid);

// Canonical little-endian bytes for a descriptor value:
//   Bytes  -> as is
//   Text   -> UTF-8 bytes
//   Number -> 2 bytes for the unsigned-16 descriptors above, 8 bytes otherwise
//   UInt16 -> 2 bytes
//   Other  -> empty, with a warning
// The L2CAP PSM value may be reported as Number or as UInt16; both land on the same 2 bytes.
adapter::Bytes normalize_descriptor_value(const std::string        &descriptor_uuid,
                                          const adapter::NativeValue &value);

}  // namespace gatt
