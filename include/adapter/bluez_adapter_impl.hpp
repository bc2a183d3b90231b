#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

struct sd_bus;
struct sd_bus_slot;

#include "adapter/bluez_adapter.hpp"

namespace adapter
{

// One outstanding async method call; the reply callback gets this as userdata.
struct BluezCall
{
    enum class Op
    {
        Connect,
        Disconnect,
        ReadCharacteristic,
        WriteCharacteristic,
        WriteCommand,  // write without response
        ReadDescriptor,
        WriteDescriptor,
        StartNotify,
        StopNotify,
        ReadRssi
    };

    BluezAdapter::Impl *impl = nullptr;
    Op                  op   = Op::Connect;
    DeviceId            dev;
    Handle              handle;
    sd_bus_slot        *slot = nullptr;
    bool                done = false;  // reply handled; pruned by the bus loop
};

struct BluezDevice
{
    std::string                path;  // "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF"
    bool                       connect_pending = false;
    bool                       linked          = false;
    bool                       resolved        = false;  // Device1.ServicesResolved
    bool                       discover_wanted = false;  // ServicesDiscovered owed
    bool                       discovered      = false;
    std::vector<std::string>   filter;
    std::vector<NativeService> tree;
    std::set<Handle>           notifying;
    int                        commands_inflight = 0;  // unacknowledged write commands
    int                        disconnect_code   = 0;  // from Device1.Disconnected, if any
    int                        mtu               = 0;
};

struct BluezAdapter::Impl
{
    explicit Impl(BluezAdapter &o) : owner(o) {}

    BluezAdapter &owner;

    // serialize all sd-bus access
    std::mutex bus_mu;

#if GATTLINK_HAVE_SDBUS
    sd_bus *bus = nullptr;

    sd_bus_slot *props_slot      = nullptr;  // PropertiesChanged
    sd_bus_slot *removed_slot    = nullptr;  // InterfacesRemoved
    sd_bus_slot *disconnect_slot = nullptr;  // Device1.Disconnected(reason, message)
#endif
    std::thread       loop;
    std::thread       dispatch;
    std::atomic<bool> running{false};

    std::string adapter_path;  // "/org/bluez/hci0"
    std::string unique_name;   // our bus unique name (debug)

    std::atomic<PowerState> power{PowerState::Unknown};

    // Guarded by bus_mu: callbacks run under bus_mu; commands must also lock bus_mu.
    std::map<DeviceId, BluezDevice>       devices;
    std::list<std::unique_ptr<BluezCall>> calls;

    // events waiting for the dispatch thread; lock order bus_mu -> out_mu
    std::mutex              out_mu;
    std::condition_variable out_cv;
    std::deque<Event>       outbox;
    bool                    out_stop = false;

    BluezDevice &device(const DeviceId &dev);  // creates on first use
    // device owning an object path (the device itself or one of its GATT objects)
    BluezDevice *find_by_path(const std::string &path, DeviceId *id = nullptr);
    void         queue(Event e);
};

}  // namespace adapter
