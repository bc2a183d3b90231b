#pragma once

#if GATTLINK_HAVE_SDBUS
#include <systemd/sd-bus.h>

namespace adapter
{

// Bus callbacks; userdata is BluezAdapter::Impl (signals) or BluezCall (method replies).
// All run on the bus loop thread under bus_mu and only queue events.
int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_device_disconnected(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_call_reply(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);

}  // namespace adapter
#endif  // GATTLINK_HAVE_SDBUS
