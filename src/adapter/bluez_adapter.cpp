#include "adapter/bluez_adapter.hpp"
#include "adapter/bluez_adapter_impl.hpp"
#include "adapter/bluez_dbus_util.hpp"
#include "adapter/bluez_helper.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#if GATTLINK_HAVE_SDBUS
#include <systemd/sd-bus.h>
#endif

namespace adapter
{

// ====== Impl helpers (bus_mu held) ======

BluezDevice &BluezAdapter::Impl::device(const DeviceId &dev)
{
    auto it = devices.find(dev);
    if (it == devices.end())
    {
        BluezDevice d;
        d.path = device_path(adapter_path, dev);
        it     = devices.emplace(dev, std::move(d)).first;
    }
    return it->second;
}

BluezDevice *BluezAdapter::Impl::find_by_path(const std::string &path, DeviceId *id)
{
    for (auto &kv : devices)
    {
        if (path_under(path, kv.second.path))
        {
            if (id)
                *id = kv.first;
            return &kv.second;
        }
    }
    return nullptr;
}

void BluezAdapter::Impl::queue(Event e)
{
    {
        std::lock_guard<std::mutex> lk(out_mu);
        outbox.push_back(std::move(e));
    }
    out_cv.notify_one();
}

#if GATTLINK_HAVE_SDBUS
namespace
{

struct GattObject
{
    std::string   iface;  // GattService1 / GattCharacteristic1 / GattDescriptor1
    std::string   uuid;
    std::string   parent;  // Service (characteristic) or Characteristic (descriptor)
    std::uint32_t flags = 0;
    uint16_t      mtu   = 0;
};

// a{sv} of one GATT interface
int read_gatt_props(sd_bus_message *m, GattObject &o)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;

        if (key && strcmp(key, "UUID") == 0)
            r = read_var_s(m, o.uuid);
        else if (key && (strcmp(key, "Service") == 0 || strcmp(key, "Characteristic") == 0))
            r = read_var_o(m, o.parent);
        else if (key && strcmp(key, "Flags") == 0)
            r = read_var_flags(m, o.flags);
        else if (key && strcmp(key, "MTU") == 0)
            r = read_var_u16(m, o.mtu);
        else
            r = sd_bus_message_skip(m, "v");
        if (r < 0)
            return r;

        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);
}

// ======================================================================
// Function: walk_services
// - In: bus_mu locked, device linked and ServicesResolved
// - Out: d.tree rebuilt from the exported GATT objects, filtered by d.filter
// - Note: one GetManagedObjects; returns the largest characteristic MTU seen in *mtu
// ======================================================================
int walk_services(sd_bus *bus, BluezDevice &d, int *mtu)
{
    sd_bus_message *rep = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_call_method(bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                               "GetManagedObjects", &err, &rep, "");
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] GetManagedObjects failed: %s", err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        return r;
    }
    sd_bus_error_free(&err);

    std::map<std::string, GattObject> objects;  // by object path, so handles come out sorted
    r = sd_bus_message_enter_container(rep, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    if (r < 0)
        goto out;
    while ((r = sd_bus_message_enter_container(rep, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *obj = nullptr;
        if ((r = sd_bus_message_read(rep, "o", &obj)) < 0)
            goto out;
        const bool mine = obj && path_under(obj, d.path) && d.path != obj;

        if ((r = sd_bus_message_enter_container(rep, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0)
            goto out;
        while ((r = sd_bus_message_enter_container(rep, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
        {
            const char *iface = nullptr;
            if ((r = sd_bus_message_read(rep, "s", &iface)) < 0)
                goto out;
            const bool gatt = iface && (strcmp(iface, "org.bluez.GattService1") == 0 ||
                                        strcmp(iface, "org.bluez.GattCharacteristic1") == 0 ||
                                        strcmp(iface, "org.bluez.GattDescriptor1") == 0);
            if (mine && gatt)
            {
                GattObject o;
                o.iface = iface + strlen("org.bluez.");
                if ((r = read_gatt_props(rep, o)) < 0)
                    goto out;
                objects[obj] = std::move(o);
            }
            else if ((r = sd_bus_message_skip(rep, "a{sv}")) < 0)
                goto out;
            if ((r = sd_bus_message_exit_container(rep)) < 0)
                goto out;
        }
        if (r < 0)
            goto out;
        if ((r = sd_bus_message_exit_container(rep)) < 0)  // a{sa{sv}}
            goto out;
        if ((r = sd_bus_message_exit_container(rep)) < 0)  // dict entry
            goto out;
    }
    if (r < 0)
        goto out;
    r = sd_bus_message_exit_container(rep);

out:
    sd_bus_message_unref(rep);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] GetManagedObjects parse failed: %s", strerror(-r));
        return r;
    }

    std::vector<NativeService> tree;
    for (const auto &kv : objects)
    {
        if (kv.second.iface != "GattService1")
            continue;
        const std::string uuid = lower(kv.second.uuid);
        if (!d.filter.empty() &&
            std::find(d.filter.begin(), d.filter.end(), uuid) == d.filter.end())
            continue;
        tree.push_back(NativeService{uuid, kv.first, {}});
    }
    for (auto &svc : tree)
    {
        for (const auto &kv : objects)
        {
            if (kv.second.iface != "GattCharacteristic1" || kv.second.parent != svc.handle)
                continue;
            NativeCharacteristic chr{lower(kv.second.uuid), kv.first, kv.second.flags, {}};
            if (mtu && kv.second.mtu > *mtu)
                *mtu = kv.second.mtu;
            for (const auto &dkv : objects)
            {
                if (dkv.second.iface == "GattDescriptor1" && dkv.second.parent == kv.first)
                    chr.descriptors.push_back(NativeDescriptor{lower(dkv.second.uuid), dkv.first});
            }
            svc.characteristics.push_back(std::move(chr));
        }
    }
    d.tree = std::move(tree);
    return 0;
}

// Options map for GATT ReadValue/WriteValue; `type` empty leaves it out.
int append_options(sd_bus_message *msg, const char *type)
{
    int r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    if (type && *type)
    {
        // dict entry: "type" -> variant "s"
        if ((r = sd_bus_message_open_container(msg, SD_BUS_TYPE_DICT_ENTRY, "sv")) < 0)
            return r;
        if ((r = sd_bus_message_append(msg, "s", "type")) < 0)
            return r;
        if ((r = sd_bus_message_open_container(msg, SD_BUS_TYPE_VARIANT, "s")) < 0)
            return r;
        if ((r = sd_bus_message_append(msg, "s", type)) < 0)
            return r;
        if ((r = sd_bus_message_close_container(msg)) < 0)  // variant
            return r;
        if ((r = sd_bus_message_close_container(msg)) < 0)  // dict-entry
            return r;
    }
    return sd_bus_message_close_container(msg);  // a{sv}
}

}  // namespace

// ======================================================================
// Function: submit (bus_mu locked)
// - In: built method call, ownership of msg taken
// - Out: 0 when sent; the reply lands in bluez_on_call_reply on the bus loop
// ======================================================================
static int submit(BluezAdapter::Impl &impl, std::unique_ptr<BluezCall> call, sd_bus_message *msg)
{
    call->impl = &impl;
    int r = sd_bus_call_async(impl.bus, &call->slot, msg, bluez_on_call_reply, call.get(), 0);
    sd_bus_message_unref(msg);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] call to %s failed: %s", call->handle.empty() ? call->dev.c_str()
                                                                       : call->handle.c_str(),
                 strerror(-r));
        return r;
    }
    impl.calls.push_back(std::move(call));
    return 0;
}

static std::unique_ptr<BluezCall> make_call(BluezCall::Op op, const DeviceId &dev,
                                            const Handle &h = {})
{
    auto c    = std::make_unique<BluezCall>();
    c->op     = op;
    c->dev    = dev;
    c->handle = h;
    return c;
}

// Replies already handled: release their slots. Runs on the bus loop, after processing.
static void prune_calls(BluezAdapter::Impl &impl)
{
    for (auto it = impl.calls.begin(); it != impl.calls.end();)
    {
        if ((*it)->done)
        {
            unref_slot((*it)->slot);
            it = impl.calls.erase(it);
        }
        else
            ++it;
    }
}

// Owed ServicesDiscovered responses whose device has resolved its services.
static void pump_discovery(BluezAdapter::Impl &impl)
{
    for (auto &kv : impl.devices)
    {
        BluezDevice &d = kv.second;
        if (!d.discover_wanted || !d.linked || !d.resolved)
            continue;
        d.discover_wanted = false;

        int   mtu = 0;
        int   r   = walk_services(impl.bus, d, &mtu);
        Event ev  = Event::response(kv.first, ResponseKind::ServicesDiscovered, d.path);
        if (r < 0)
        {
            ev.error = NativeError{r, std::string("GetManagedObjects failed: ") + strerror(-r)};
        }
        else
        {
            d.discovered = true;
            d.mtu        = mtu;
            ev.mtu       = mtu;
            LOG_INFO("[BLUEZ] %s: %zu services resolved (mtu=%d)", kv.first.c_str(),
                     d.tree.size(), mtu);
        }
        impl.queue(std::move(ev));
    }
}
#endif

BluezAdapter::BluezAdapter(BluezConfig cfg)
    : cfg_(std::move(cfg)), impl_(std::make_unique<Impl>(*this))
{
    impl_->adapter_path = "/org/bluez/" + cfg_.adapter;
}

BluezAdapter::~BluezAdapter()
{
    stop();
}

// ======================================================================
// Function: BluezAdapter::start
// - In: adapter name in config, not started yet
// - Out: bus connected, signal matches installed, bus loop and dispatch threads running
// - Note: an adapter that is missing or cannot be read reports Unsupported
// ======================================================================
bool BluezAdapter::start()
{
#if !GATTLINK_HAVE_SDBUS
    LOG_ERROR("[BLUEZ] sd-bus not available (GATTLINK_HAVE_SDBUS=0)");
    impl_->power.store(PowerState::Unsupported);
    return false;
#else
    // connect system bus
    int r = sd_bus_open_system(&impl_->bus);
    if (r < 0 || !impl_->bus)
    {
        LOG_ERROR("[BLUEZ] failed to connect system bus: %s", strerror(-r));
        return false;
    }

    const char *name = nullptr;
    if (sd_bus_get_unique_name(impl_->bus, &name) >= 0 && name)
        impl_->unique_name = name;

    r = sd_bus_match_signal(impl_->bus, &impl_->props_slot, "org.bluez", nullptr,
                            "org.freedesktop.DBus.Properties", "PropertiesChanged",
                            bluez_on_props_changed, impl_.get());
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] subscribe to PropertiesChanged failed: %s", strerror(-r));
        return false;
    }
    r = sd_bus_match_signal(impl_->bus, &impl_->removed_slot, "org.bluez", "/",
                            "org.freedesktop.DBus.ObjectManager", "InterfacesRemoved",
                            bluez_on_iface_removed, impl_.get());
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] subscribe to InterfacesRemoved failed: %s", strerror(-r));
        return false;
    }
    // Older BlueZ has no Device1.Disconnected signal; the reason is then unknown (code 0).
    r = sd_bus_match_signal(impl_->bus, &impl_->disconnect_slot, "org.bluez", nullptr,
                            "org.bluez.Device1", "Disconnected", bluez_on_device_disconnected,
                            impl_.get());
    if (r < 0)
        LOG_WARN("[BLUEZ] subscribe to Device1.Disconnected failed: %s", strerror(-r));

    sd_bus_error err{};
    int          powered = 0;
    r = sd_bus_get_property_trivial(impl_->bus, "org.bluez", impl_->adapter_path.c_str(),
                                    "org.bluez.Adapter1", "Powered", &err, 'b', &powered);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] %s not available: %s", impl_->adapter_path.c_str(),
                 err.message ? err.message : strerror(-r));
        impl_->power.store(PowerState::Unsupported);
    }
    else
    {
        impl_->power.store(powered ? PowerState::PoweredOn : PowerState::PoweredOff);
    }
    sd_bus_error_free(&err);
    LOG_INFO("[BLUEZ] %s ready (%s) as %s", impl_->adapter_path.c_str(),
             to_string(impl_->power.load()), impl_->unique_name.c_str());

    impl_->running.store(true, std::memory_order_relaxed);
    impl_->dispatch = std::thread([this] {
        while (true)
        {
            Event e;
            {
                std::unique_lock<std::mutex> lk(impl_->out_mu);
                impl_->out_cv.wait(lk, [this] { return impl_->out_stop || !impl_->outbox.empty(); });
                if (impl_->outbox.empty())
                    return;
                e = std::move(impl_->outbox.front());
                impl_->outbox.pop_front();
            }
            events_.publish(e);
        }
    });
    impl_->loop = std::thread([this] {
        while (impl_->running.load(std::memory_order_relaxed))
        {
            {
                std::lock_guard<std::mutex> lk(impl_->bus_mu);
                while (1)
                {
                    int pr = sd_bus_process(impl_->bus, nullptr);
                    if (pr <= 0)
                        break;
                }
                pump_discovery(*impl_);
                prune_calls(*impl_);
            }
            // do not hold the lock while waiting, otherwise commands stall
            {
                const uint64_t WAIT_USEC = 100000;  // 100ms
                sd_bus_wait(impl_->bus, WAIT_USEC);
            }
        }
    });

    return true;
#endif
}

// ======================================================================
// Function: BluezAdapter::stop
// - In: may be called anytime, also when start() failed halfway
// - Out: links we opened are dropped, threads joined, bus released
// - Note: joins outside of bus_mu; queued events are still delivered
// ======================================================================
void BluezAdapter::stop()
{
#if GATTLINK_HAVE_SDBUS
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        // Disconnect devices we linked (best-effort)
        for (auto &kv : impl_->devices)
        {
            if (!impl_->bus || (!kv.second.linked && !kv.second.connect_pending))
                continue;
            sd_bus_error    derr{};
            sd_bus_message *drep = nullptr;
            (void)sd_bus_call_method(impl_->bus, "org.bluez", kv.second.path.c_str(),
                                     "org.bluez.Device1", "Disconnect", &derr, &drep, "");
            if (drep)
                sd_bus_message_unref(drep);
            sd_bus_error_free(&derr);
        }
        impl_->running.store(false, std::memory_order_relaxed);
        // Wake the event loop thread if it's in sd_bus_wait()
        if (impl_->bus)
            sd_bus_close(impl_->bus);
    }

    // Join OUTSIDE of the mutex to avoid deadlocks with the loop thread.
    if (impl_->loop.joinable())
        impl_->loop.join();

    {
        std::lock_guard<std::mutex> lk(impl_->out_mu);
        impl_->out_stop = true;
    }
    impl_->out_cv.notify_all();
    if (impl_->dispatch.joinable())
        impl_->dispatch.join();

    for (auto &c : impl_->calls)
        unref_slot(c->slot);
    impl_->calls.clear();
    unref_slot(impl_->props_slot);
    unref_slot(impl_->removed_slot);
    unref_slot(impl_->disconnect_slot);

    if (impl_->bus)
    {
        sd_bus_flush_close_unref(impl_->bus);
        impl_->bus = nullptr;
    }
#endif
}

PowerState BluezAdapter::power_state() const
{
    return impl_->power.load();
}

// ======================================================================
// Function: BluezAdapter::connect
// - In: MAC of a device BlueZ already knows (seen by a scan or paired)
// - Out: 0 when Device1.Connect was sent; Connected / ConnectFailed follow
// ======================================================================
int BluezAdapter::connect(const DeviceId &dev)
{
#if !GATTLINK_HAVE_SDBUS
    (void)dev;
    return -ENOTSUP;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
        return -ENODEV;
    BluezDevice &d = impl_->device(dev);
    if (d.linked || d.connect_pending)
        return -EALREADY;

    sd_bus_message *msg = nullptr;
    int r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez", d.path.c_str(),
                                           "org.bluez.Device1", "Connect");
    if (r < 0)
        return r;
    r = submit(*impl_, make_call(BluezCall::Op::Connect, dev), msg);
    if (r < 0)
        return r;
    d.connect_pending = true;
    d.disconnect_code = 0;
    LOG_INFO("[BLUEZ] Device1.Connect %s submitted", d.path.c_str());
    return 0;
#endif
}

// ======================================================================
// Function: BluezAdapter::cancel_connection
// - Out: a pending connect is abandoned and reported as Disconnected(0) at once; a live link
//        is torn down and reported when BlueZ drops Connected
// ======================================================================
int BluezAdapter::cancel_connection(const DeviceId &dev)
{
#if !GATTLINK_HAVE_SDBUS
    (void)dev;
    return -ENOTSUP;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
        return -ENODEV;
    auto it = impl_->devices.find(dev);
    if (it == impl_->devices.end() || (!it->second.linked && !it->second.connect_pending))
        return 0;
    BluezDevice &d = it->second;

    if (d.connect_pending)
    {
        // drop the Connect reply callback, so its late reply cannot report a link
        for (auto &c : impl_->calls)
        {
            if (c->op == BluezCall::Op::Connect && c->dev == dev && !c->done)
            {
                unref_slot(c->slot);
                c->done = true;
            }
        }
        d.connect_pending = false;
        impl_->queue(Event::link(Event::Type::Disconnected, dev, 0));
    }

    sd_bus_message *msg = nullptr;
    int r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez", d.path.c_str(),
                                           "org.bluez.Device1", "Disconnect");
    if (r < 0)
        return r;
    return submit(*impl_, make_call(BluezCall::Op::Disconnect, dev), msg);
#endif
}

int BluezAdapter::discover_services(const DeviceId &dev, const std::vector<std::string> &filter)
{
#if !GATTLINK_HAVE_SDBUS
    (void)dev;
    (void)filter;
    return -ENOTSUP;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    auto it = impl_->devices.find(dev);
    if (it == impl_->devices.end() || !it->second.linked)
        return -ENOTCONN;
    BluezDevice &d = it->second;
    d.filter.clear();
    for (const auto &u : filter)
        d.filter.push_back(lower(u));
    d.tree.clear();
    d.discovered      = false;
    d.discover_wanted = true;
    if (!d.resolved)
        LOG_DEBUG("[BLUEZ] %s: waiting for ServicesResolved", dev.c_str());
    pump_discovery(*impl_);
    return 0;
#endif
}

int BluezAdapter::discover_characteristics(const DeviceId &dev, const Handle &service)
{
#if !GATTLINK_HAVE_SDBUS
    (void)dev;
    (void)service;
    return -ENOTSUP;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    auto it = impl_->devices.find(dev);
    if (it == impl_->devices.end() || !it->second.linked)
        return -ENOTCONN;
    impl_->queue(Event::response(dev, ResponseKind::CharacteristicsDiscovered, service));
    return 0;
#endif
}

int BluezAdapter::discover_descriptors(const DeviceId &dev, const Handle &characteristic)
{
#if !GATTLINK_HAVE_SDBUS
    (void)dev;
    (void)characteristic;
    return -ENOTSUP;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    auto it = impl_->devices.find(dev);
    if (it == impl_->devices.end() || !it->second.linked)
        return -ENOTCONN;
    impl_->queue(Event::response(dev, ResponseKind::DescriptorsDiscovered, characteristic));
    return 0;
#endif
}

std::vector<NativeService> BluezAdapter::services(const DeviceId &dev) const
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    auto                        it = impl_->devices.find(dev);
    if (it == impl_->devices.end() || !it->second.discovered)
        return {};
    return it->second.tree;
}

#if GATTLINK_HAVE_SDBUS
// Builds and submits one GATT method call on `h` (bus_mu locked, device linked).
static int gatt_call(BluezAdapter::Impl &impl,
                     BluezCall::Op       op,
                     const DeviceId     &dev,
                     const Handle       &h,
                     const char         *iface,
                     const char         *method,
                     const Bytes        *data,
                     const char         *type)
{
    auto it = impl.devices.find(dev);
    if (it == impl.devices.end() || !it->second.linked)
        return -ENOTCONN;
    if (!path_under(h, it->second.path))
        return -EINVAL;

    sd_bus_message *msg = nullptr;
    int r = sd_bus_message_new_method_call(impl.bus, &msg, "org.bluez", h.c_str(), iface, method);
    if (r < 0)
        return r;
    if (data)
        r = sd_bus_message_append_array(msg, 'y', data->data(), data->size());
    if (r >= 0 && (data || strcmp(method, "ReadValue") == 0))
        r = append_options(msg, type);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] %s build failed: %s", method, strerror(-r));
        sd_bus_message_unref(msg);
        return r;
    }
    return submit(impl, make_call(op, dev, h), msg);
}
#endif

int BluezAdapter::read_characteristic(const DeviceId &dev, const Handle &h)
{
#if !GATTLINK_HAVE_SDBUS
    (void)dev;
    (void)h;
    return -ENOTSUP;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    return gatt_call(*impl_, BluezCall::Op::ReadCharacteristic, dev, h,
                     "org.bluez.GattCharacteristic1", "ReadValue", nullptr, nullptr);
#endif
}

// ======================================================================
// Function: BluezAdapter::write_characteristic
// - In: WithResponse -> WriteValue type "request", completes with CharacteristicWritten
//       WithoutResponse -> type "command", no completion; the reply frees the send slot
// ======================================================================
int BluezAdapter::write_characteristic(const DeviceId &dev,
                                       const Handle   &h,
                                       const Bytes    &data,
                                       WriteType       type)
{
#if !GATTLINK_HAVE_SDBUS
    (void)dev;
    (void)h;
    (void)data;
    (void)type;
    return -ENOTSUP;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (type == WriteType::WithResponse)
        return gatt_call(*impl_, BluezCall::Op::WriteCharacteristic, dev, h,
                         "org.bluez.GattCharacteristic1", "WriteValue", &data, "request");

    int r = gatt_call(*impl_, BluezCall::Op::WriteCommand, dev, h,
                      "org.bluez.GattCharacteristic1", "WriteValue", &data, "command");
    if (r == 0)
        impl_->devices[dev].commands_inflight++;
    LOG_DEBUG("[BLUEZ] WriteValue(command) len=%zu %s", data.size(), r == 0 ? "OK" : "FAIL");
    return r;
#endif
}

int BluezAdapter::read_descriptor(const DeviceId &dev, const Handle &h)
{
#if !GATTLINK_HAVE_SDBUS
    (void)dev;
    (void)h;
    return -ENOTSUP;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    return gatt_call(*impl_, BluezCall::Op::ReadDescriptor, dev, h, "org.bluez.GattDescriptor1",
                     "ReadValue", nullptr, nullptr);
#endif
}

int BluezAdapter::write_descriptor(const DeviceId &dev, const Handle &h, const Bytes &data)
{
#if !GATTLINK_HAVE_SDBUS
    (void)dev;
    (void)h;
    (void)data;
    return -ENOTSUP;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    return gatt_call(*impl_, BluezCall::Op::WriteDescriptor, dev, h, "org.bluez.GattDescriptor1",
                     "WriteValue", &data, nullptr);
#endif
}

int BluezAdapter::set_notify(const DeviceId &dev, const Handle &h, bool enabled)
{
#if !GATTLINK_HAVE_SDBUS
    (void)dev;
    (void)h;
    (void)enabled;
    return -ENOTSUP;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    return gatt_call(*impl_, enabled ? BluezCall::Op::StartNotify : BluezCall::Op::StopNotify, dev,
                     h, "org.bluez.GattCharacteristic1", enabled ? "StartNotify" : "StopNotify",
                     nullptr, nullptr);
#endif
}

// RSSI is a Device1 property; BlueZ only has one while the device is being scanned.
int BluezAdapter::read_rssi(const DeviceId &dev)
{
#if !GATTLINK_HAVE_SDBUS
    (void)dev;
    return -ENOTSUP;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    auto it = impl_->devices.find(dev);
    if (it == impl_->devices.end() || !it->second.linked)
        return -ENOTCONN;

    sd_bus_message *msg = nullptr;
    int r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez", it->second.path.c_str(),
                                           "org.freedesktop.DBus.Properties", "Get");
    if (r < 0)
        return r;
    r = sd_bus_message_append(msg, "ss", "org.bluez.Device1", "RSSI");
    if (r < 0)
    {
        sd_bus_message_unref(msg);
        return r;
    }
    return submit(*impl_, make_call(BluezCall::Op::ReadRssi, dev), msg);
#endif
}

bool BluezAdapter::can_send_write_without_response(const DeviceId &dev) const
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    auto                        it = impl_->devices.find(dev);
    return it == impl_->devices.end() || it->second.commands_inflight == 0;
}

std::string BluezAdapter::name(const DeviceId &dev) const
{
#if !GATTLINK_HAVE_SDBUS
    (void)dev;
    return "";
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
        return "";
    const std::string path  = device_path(impl_->adapter_path, dev);
    sd_bus_error      err{};
    char             *alias = nullptr;
    int r = sd_bus_get_property_string(impl_->bus, "org.bluez", path.c_str(), "org.bluez.Device1",
                                       "Alias", &err, &alias);
    std::string out;
    if (r >= 0 && alias)
        out = alias;
    else
        LOG_DEBUG("[BLUEZ] Alias of %s unavailable: %s", path.c_str(),
                  err.message ? err.message : strerror(-r));
    std::free(alias);
    sd_bus_error_free(&err);
    return out;
#endif
}

}  // namespace adapter
