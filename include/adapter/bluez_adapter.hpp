#pragma once
#include <memory>
#include <string>
#include <vector>

#include "adapter/event_stream.hpp"
#include "adapter/native_adapter.hpp"
#include "util/constants.hpp"

#if GATTLINK_HAVE_SDBUS
#include <systemd/sd-bus.h>

namespace
{
// TU-local wrapper to unref and null a slot ptr
inline void unref_slot(sd_bus_slot *&s)
{
    if (s)
    {
        sd_bus_slot_unref(s);
        s = nullptr;
    }
}
}  // namespace

#endif

/*
BlueZ adapter (org.bluez over the system bus, sd-bus):

  session threads ──command──> [bus_mu] async method call ──┐
                                                            v
  bus loop: sd_bus_process ─> replies / PropertiesChanged / Device1.Disconnected
                 │                         │
                 └──> outbox <─────────────┘   (immediate completions are queued directly)
                            │
                            v
            dispatch thread: publish on events(), one at a time, in queue order

Handles are D-Bus object paths; a device is its MAC ("AA:BB:CC:DD:EE:FF") under the
configured adapter. GATT discovery is done by BlueZ once connected (ServicesResolved);
the characteristic and descriptor steps complete from the already exported objects.
*/

namespace adapter
{

struct BluezConfig
{
    std::string adapter = constants::DEFAULT_ADAPTER;  // "hci0"
};

class BluezAdapter final : public NativeAdapter
{
  public:
    struct Impl;

    explicit BluezAdapter(BluezConfig cfg);
    ~BluezAdapter() override;

    BluezAdapter(const BluezAdapter &)            = delete;
    BluezAdapter &operator=(const BluezAdapter &) = delete;

    // Connects the system bus, subscribes to BlueZ signals and spawns the bus loop.
    bool start();
    void stop();

    const BluezConfig &config() const { return cfg_; }

    // ---- NativeAdapter ----
    PowerState   power_state() const override;
    EventStream &events() override { return events_; }

    int connect(const DeviceId &dev) override;
    int cancel_connection(const DeviceId &dev) override;
    int discover_services(const DeviceId &dev, const std::vector<std::string> &filter) override;
    int discover_characteristics(const DeviceId &dev, const Handle &service) override;
    int discover_descriptors(const DeviceId &dev, const Handle &characteristic) override;
    std::vector<NativeService> services(const DeviceId &dev) const override;

    int read_characteristic(const DeviceId &dev, const Handle &h) override;
    int write_characteristic(const DeviceId &dev,
                             const Handle   &h,
                             const Bytes    &data,
                             WriteType       type) override;
    int read_descriptor(const DeviceId &dev, const Handle &h) override;
    int write_descriptor(const DeviceId &dev, const Handle &h, const Bytes &data) override;
    int set_notify(const DeviceId &dev, const Handle &h, bool enabled) override;
    int read_rssi(const DeviceId &dev) override;

    bool        can_send_write_without_response(const DeviceId &dev) const override;
    std::string name(const DeviceId &dev) const override;

  private:
    BluezConfig           cfg_;
    EventStream           events_;
    std::unique_ptr<Impl> impl_;
};

}  // namespace adapter
