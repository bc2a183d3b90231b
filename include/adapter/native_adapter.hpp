#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace adapter
{

class EventStream;

using Bytes    = std::vector<std::uint8_t>;
using DeviceId = std::string;  // stable per device (BlueZ: "AA:BB:CC:DD:EE:FF")
using Handle   = std::string;  // native attribute reference (BlueZ: object path)

enum class PowerState
{
    Unknown,
    Resetting,
    Unsupported,
    Unauthorized,
    PoweredOff,
    PoweredOn
};

const char *to_string(PowerState s);

enum class WriteType
{
    WithResponse,
    WithoutResponse
};

// GATT characteristic property bits (Bluetooth Core Vol 3 Part G 3.3.1.1)
namespace props
{
constexpr std::uint32_t Broadcast            = 0x01;
constexpr std::uint32_t Read                 = 0x02;
constexpr std::uint32_t WriteWithoutResponse = 0x04;
constexpr std::uint32_t Write                = 0x08;
constexpr std::uint32_t Notify               = 0x10;
constexpr std::uint32_t Indicate             = 0x20;
constexpr std::uint32_t SignedWrite          = 0x40;
constexpr std::uint32_t ExtendedProperties   = 0x80;
}  // namespace props

struct NativeDescriptor
{
    std::string uuid;
    Handle      handle;
};

struct NativeCharacteristic
{
    std::string                   uuid;
    Handle                        handle;
    std::uint32_t                 properties = 0;
    std::vector<NativeDescriptor> descriptors;
};

struct NativeService
{
    std::string                       uuid;
    Handle                            handle;
    std::vector<NativeCharacteristic> characteristics;
};

// Descriptor values arrive in whatever representation the stack picked.
struct NativeValue
{
    enum class Type
    {
        Bytes,
        Text,
        Number,  // platform integer of unspecified width
        UInt16,
        Other
    };
    Type          type = Type::Bytes;
    Bytes         bytes;
    std::string   text;
    std::uint64_t number = 0;
    std::uint16_t u16    = 0;
    std::string   type_name;  // Other only, for diagnostics
};

enum class ResponseKind
{
    ServicesDiscovered,
    CharacteristicsDiscovered,
    DescriptorsDiscovered,
    CharacteristicWritten,
    DescriptorRead,
    DescriptorWritten,
    NotifyStateUpdated,
    RssiRead
};

const char *to_string(ResponseKind k);

struct NativeError
{
    int         code = 0;
    std::string message;
};

struct Event
{
    enum class Type
    {
        PowerStateChanged,
        Connected,
        ConnectFailed,  // code = HCI status
        Disconnected,   // code = HCI status, 0 when no error
        Response,
        ValueUpdated,  // characteristic value: read result or notification
        WriteWithoutResponseReady
    };

    Type                       type = Type::Response;
    DeviceId                   device;
    PowerState                 power = PowerState::Unknown;
    int                        code  = 0;
    ResponseKind               kind  = ResponseKind::ServicesDiscovered;
    Handle                     handle;
    std::optional<NativeError> error;
    Bytes                      bytes;
    NativeValue                value;     // DescriptorRead
    int                        rssi = 0;  // RssiRead
    int                        mtu  = 0;  // ServicesDiscovered

    static Event power_changed(PowerState s)
    {
        Event e;
        e.type  = Type::PowerStateChanged;
        e.power = s;
        return e;
    }
    static Event link(Type t, DeviceId dev, int code = 0)
    {
        Event e;
        e.type   = t;
        e.device = std::move(dev);
        e.code   = code;
        return e;
    }
    static Event response(DeviceId dev, ResponseKind k, Handle h = {})
    {
        Event e;
        e.type   = Type::Response;
        e.device = std::move(dev);
        e.kind   = k;
        e.handle = std::move(h);
        return e;
    }
    static Event value_updated(DeviceId dev, Handle h, Bytes data)
    {
        Event e;
        e.type   = Type::ValueUpdated;
        e.device = std::move(dev);
        e.handle = std::move(h);
        e.bytes  = std::move(data);
        return e;
    }
};

// Command side of the native stack. Commands return 0 once submitted or a negative errno;
// their outcome arrives later on events(). Implementations own the event stream.
struct NativeAdapter
{
    virtual PowerState   power_state() const = 0;
    virtual EventStream &events()            = 0;

    virtual int connect(const DeviceId &dev)           = 0;
    virtual int cancel_connection(const DeviceId &dev) = 0;

    virtual int discover_services(const DeviceId &dev, const std::vector<std::string> &filter) = 0;
    virtual int discover_characteristics(const DeviceId &dev, const Handle &service)           = 0;
    virtual int discover_descriptors(const DeviceId &dev, const Handle &characteristic)        = 0;
    // Current native service tree (what discovery has produced so far)
    virtual std::vector<NativeService> services(const DeviceId &dev) const = 0;

    virtual int read_characteristic(const DeviceId &dev, const Handle &h) = 0;
    virtual int write_characteristic(const DeviceId &dev,
                                     const Handle   &h,
                                     const Bytes    &data,
                                     WriteType       type)                = 0;
    virtual int read_descriptor(const DeviceId &dev, const Handle &h)     = 0;
    virtual int write_descriptor(const DeviceId &dev, const Handle &h, const Bytes &data) = 0;
    virtual int set_notify(const DeviceId &dev, const Handle &h, bool enabled)            = 0;
    virtual int read_rssi(const DeviceId &dev)                                            = 0;

    virtual bool        can_send_write_without_response(const DeviceId &dev) const = 0;
    virtual std::string name(const DeviceId & /*dev*/) const { return ""; }

    virtual ~NativeAdapter() = default;
};

}  // namespace adapter
