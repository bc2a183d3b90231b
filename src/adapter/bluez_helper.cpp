#include "adapter/bluez_helper.hpp"
#include "adapter/bluez_adapter_impl.hpp"
#include "adapter/bluez_dbus_util.hpp"
#include "util/log.hpp"

#include <cstring>
#include <string>

#if GATTLINK_HAVE_SDBUS
#include <systemd/sd-bus.h>

namespace adapter
{

namespace
{
// Link went away: forget everything the stack exported for this device.
void link_down(BluezAdapter::Impl *impl, const DeviceId &id, BluezDevice &d)
{
    const int code = d.disconnect_code;
    d.linked            = false;
    d.resolved          = false;
    d.discover_wanted   = false;
    d.discovered        = false;
    d.commands_inflight = 0;
    d.disconnect_code   = 0;
    d.tree.clear();
    d.notifying.clear();
    impl->queue(Event::link(Event::Type::Disconnected, id, code));
}

NativeError reply_error(sd_bus_message *m)
{
    const sd_bus_error *e     = sd_bus_message_get_error(m);
    const char         *ename = (e && e->name) ? e->name : "unknown";
    const char         *emsg  = (e && e->message) ? e->message : "no message";
    const int           err   = sd_bus_message_get_errno(m);
    return NativeError{err > 0 ? -err : -EIO, std::string(ename) + ": " + emsg};
}
}  // namespace

int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret_error*/)
{
    auto       *impl  = static_cast<BluezAdapter::Impl *>(userdata);
    const char *iface = nullptr;
    int         r     = sd_bus_message_read(m, "s", &iface);
    if (r < 0)
        return r;

    const bool is_adapter = iface && strcmp(iface, "org.bluez.Adapter1") == 0;
    const bool is_device  = iface && strcmp(iface, "org.bluez.Device1") == 0;
    const bool is_char    = iface && strcmp(iface, "org.bluez.GattCharacteristic1") == 0;

    bool  powered_hit   = false;
    bool  powered_val   = false;
    bool  resolved_hit  = false;
    bool  resolved_val  = false;
    bool  connected_hit = false;
    bool  connected_val = false;
    bool  value_hit     = false;
    Bytes value;

    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;

    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        r               = sd_bus_message_read(m, "s", &key);
        if (r < 0)
            return r;

        if (is_adapter && key && strcmp(key, "Powered") == 0)
        {
            r           = read_var_b(m, powered_val);
            powered_hit = true;
        }
        else if (is_device && key && strcmp(key, "Connected") == 0)
        {
            r             = read_var_b(m, connected_val);
            connected_hit = true;
        }
        else if (is_device && key && strcmp(key, "ServicesResolved") == 0)
        {
            r            = read_var_b(m, resolved_val);
            resolved_hit = true;
        }
        else if (is_char && key && strcmp(key, "Value") == 0)
        {
            r         = read_var_bytes(m, value);
            value_hit = true;
        }
        else
        {
            r = sd_bus_message_skip(m, "v");
        }
        if (r < 0)
            return r;
        r = sd_bus_message_exit_container(m);
        if (r < 0)
            return r;
    }
    if (r < 0)
        return r;
    r = sd_bus_message_exit_container(m);
    if (r < 0)
        return r;

    r = sd_bus_message_skip(m, "as");
    if (r < 0)
        return r;

    const char *path = sd_bus_message_get_path(m);
    if (!path)
        return 0;

    if (powered_hit && impl->adapter_path == path)
    {
        const PowerState next = powered_val ? PowerState::PoweredOn : PowerState::PoweredOff;
        if (impl->power.exchange(next) != next)
        {
            LOG_SYSTEM("[BLUEZ] %s Powered=%s", path, powered_val ? "true" : "false");
            impl->queue(Event::power_changed(next));
        }
        return 0;
    }

    DeviceId     id;
    BluezDevice *d = impl->find_by_path(path, &id);
    if (!d)
        return 0;

    if (resolved_hit)
    {
        d->resolved = resolved_val;
        LOG_DEBUG("[BLUEZ] ServicesResolved=%s on %s", resolved_val ? "true" : "false", path);
    }

    if (connected_hit)
    {
        if (!connected_val && d->linked)
        {
            LOG_SYSTEM("[BLUEZ] Disconnected (%s)", path);
            link_down(impl, id, *d);
        }
        else if (connected_val)
        {
            // Connect reply reports the link; a link we never asked for is not ours.
            LOG_DEBUG("[BLUEZ] Connected property became true (%s)", path);
        }
    }

    if (value_hit && d->notifying.count(path))
    {
        LOG_DEBUG("[BLUEZ] notify on %s len=%zu", path, value.size());
        impl->queue(Event::value_updated(id, path, std::move(value)));
    }
    return 0;
}

int bluez_on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *impl = static_cast<BluezAdapter::Impl *>(userdata);
    const char *obj  = nullptr;
    int         r    = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;

    bool adapter_gone = false;
    bool device_gone  = false;
    r                 = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "s");
    if (r < 0)
        return r;
    while (true)
    {
        const char *iface = nullptr;
        int         rr    = sd_bus_message_read_basic(m, 's', &iface);
        if (rr < 0)
            return rr;
        if (rr == 0)
            break;
        if (strcmp(iface, "org.bluez.Adapter1") == 0)
            adapter_gone = true;
        else if (strcmp(iface, "org.bluez.Device1") == 0)
            device_gone = true;
    }
    r = sd_bus_message_exit_container(m);
    if (r < 0)
        return r;

    const std::string path(obj);
    if (adapter_gone && path == impl->adapter_path)
    {
        if (impl->power.exchange(PowerState::Unsupported) != PowerState::Unsupported)
        {
            LOG_SYSTEM("[BLUEZ] adapter %s removed", obj);
            impl->queue(Event::power_changed(PowerState::Unsupported));
        }
        return 0;
    }

    DeviceId     id;
    BluezDevice *d = impl->find_by_path(path, &id);
    if (device_gone && d && d->path == path && d->linked)
    {
        LOG_SYSTEM("[BLUEZ] InterfacesRemoved -> device %s gone", obj);
        link_down(impl, id, *d);
    }
    return 0;
}

// Device1.Disconnected(s reason, s message) precedes Connected=false; keep its code for it.
int bluez_on_device_disconnected(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *impl   = static_cast<BluezAdapter::Impl *>(userdata);
    const char *reason = nullptr;
    const char *msg    = nullptr;
    int         r      = sd_bus_message_read(m, "ss", &reason, &msg);
    if (r < 0)
        return r;

    const char  *path = sd_bus_message_get_path(m);
    BluezDevice *d    = path ? impl->find_by_path(path) : nullptr;
    if (!d)
        return 0;
    d->disconnect_code = hci_status_for_reason(reason ? reason : "");
    LOG_INFO("[BLUEZ] %s disconnect reason %s (%s)", path, reason ? reason : "?",
             msg ? msg : "");
    return 0;
}

int bluez_on_call_reply(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *call = static_cast<BluezCall *>(userdata);
    auto *impl = call->impl;
    call->done = true;

    auto it = impl->devices.find(call->dev);
    if (it == impl->devices.end())
        return 1;
    BluezDevice &d      = it->second;
    const bool   failed = sd_bus_message_is_method_error(m, nullptr) > 0;

    switch (call->op)
    {
        case BluezCall::Op::Connect:
        {
            d.connect_pending = false;
            if (failed)
            {
                const sd_bus_error *e     = sd_bus_message_get_error(m);
                const char         *ename = (e && e->name) ? e->name : "unknown";
                const char         *emsg  = (e && e->message) ? e->message : "no message";
                LOG_ERROR("[BLUEZ] Device1.Connect %s failed: %s: %s", call->dev.c_str(), ename,
                          emsg);
                impl->queue(Event::link(Event::Type::ConnectFailed, call->dev,
                                        hci_status_for_connect_error(ename)));
                return 1;
            }
            d.linked          = true;
            d.disconnect_code = 0;
            LOG_SYSTEM("[BLUEZ] Device connected: %s", d.path.c_str());
            impl->queue(Event::link(Event::Type::Connected, call->dev));
            return 1;
        }
        case BluezCall::Op::Disconnect:
            if (failed && d.linked)
            {
                LOG_WARN("[BLUEZ] Device1.Disconnect %s failed: %s", call->dev.c_str(),
                         reply_error(m).message.c_str());
                link_down(impl, call->dev, d);
            }
            return 1;
        case BluezCall::Op::ReadCharacteristic:
        {
            Event ev = Event::value_updated(call->dev, call->handle, {});
            if (failed)
            {
                ev.error = reply_error(m);
            }
            else
            {
                const void *buf = nullptr;
                size_t      len = 0;
                int         r   = sd_bus_message_read_array(m, 'y', &buf, &len);
                if (r < 0)
                    ev.error = NativeError{r, "ReadValue: malformed reply"};
                else
                    ev.bytes.assign(static_cast<const uint8_t *>(buf),
                                    static_cast<const uint8_t *>(buf) + len);
            }
            impl->queue(std::move(ev));
            return 1;
        }
        case BluezCall::Op::WriteCommand:
            if (failed)
                LOG_WARN("[BLUEZ] WriteValue(command) %s failed: %s", call->handle.c_str(),
                         reply_error(m).message.c_str());
            if (d.commands_inflight > 0 && --d.commands_inflight == 0)
                impl->queue(Event::link(Event::Type::WriteWithoutResponseReady, call->dev));
            return 1;
        case BluezCall::Op::ReadDescriptor:
        {
            Event ev = Event::response(call->dev, ResponseKind::DescriptorRead, call->handle);
            if (failed)
            {
                ev.error = reply_error(m);
            }
            else
            {
                const void *buf = nullptr;
                size_t      len = 0;
                int         r   = sd_bus_message_read_array(m, 'y', &buf, &len);
                if (r < 0)
                {
                    ev.error = NativeError{r, "ReadValue: malformed reply"};
                }
                else
                {
                    ev.value.type = NativeValue::Type::Bytes;
                    ev.value.bytes.assign(static_cast<const uint8_t *>(buf),
                                          static_cast<const uint8_t *>(buf) + len);
                }
            }
            impl->queue(std::move(ev));
            return 1;
        }
        case BluezCall::Op::WriteCharacteristic:
        case BluezCall::Op::WriteDescriptor:
        {
            Event ev = Event::response(call->dev,
                                       call->op == BluezCall::Op::WriteDescriptor
                                           ? ResponseKind::DescriptorWritten
                                           : ResponseKind::CharacteristicWritten,
                                       call->handle);
            if (failed)
                ev.error = reply_error(m);
            impl->queue(std::move(ev));
            return 1;
        }
        case BluezCall::Op::StartNotify:
        case BluezCall::Op::StopNotify:
        {
            Event ev = Event::response(call->dev, ResponseKind::NotifyStateUpdated, call->handle);
            if (failed)
                ev.error = reply_error(m);
            else if (call->op == BluezCall::Op::StartNotify)
                d.notifying.insert(call->handle);
            else
                d.notifying.erase(call->handle);
            impl->queue(std::move(ev));
            return 1;
        }
        case BluezCall::Op::ReadRssi:
        {
            Event ev = Event::response(call->dev, ResponseKind::RssiRead);
            if (failed)
            {
                ev.error = reply_error(m);
            }
            else
            {
                int16_t rssi = 0;
                int     r    = read_var_i16(m, rssi);
                if (r < 0)
                    ev.error = NativeError{r, "RSSI: malformed reply"};
                ev.rssi = rssi;
            }
            impl->queue(std::move(ev));
            return 1;
        }
    }
    return 1;
}

}  // namespace adapter

#endif
