#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "adapter/event_stream.hpp"
#include "adapter/native_adapter.hpp"
#include "gatt/catalog.hpp"
#include "gatt/observers.hpp"
#include "session/connection.hpp"
#include "session/error.hpp"
#include "session/state.hpp"
#include "util/cancel.hpp"
#include "util/signal.hpp"

/*
Peripheral: session with one remote device.

  Disconnected ──connect()──> Connecting(LinkEstablishing)
                                   │ Connected event
                                   v
                              Connecting(DiscoveringServices) ── catalog published
                                   │
                                   v
                              Connecting(ConfiguringObservations) ── observations re-armed
                                   │
                                   v
                              Connected ──disconnect()──> Disconnecting
                                   │                          │
   link loss / connect failure / adapter off (any step) ──────┴──> Disconnected(reason)

Only one connect attempt runs at a time; concurrent connect() callers share its outcome.
GATT operations resolve references through the catalog, then run on the Connection.
*/

namespace session
{

class Peripheral;

// Runs once per successful discovery, before observations are configured. An error fails connect.
using OnServicesDiscovered = std::function<Status(Peripheral &, const gattlink::CancelToken &)>;
using OnMtuChanged         = std::function<void(int)>;

struct PeripheralOptions
{
    std::vector<std::string>      service_filter;  // empty = all services
    OnServicesDiscovered          on_services_discovered;
    OnMtuChanged                  on_mtu_changed;
    gatt::ObservationErrorHandler on_observation_error;  // default: fail the connect attempt
};

class Peripheral : private gatt::NotificationControl
{
  public:
    Peripheral(adapter::NativeAdapter &adapter, adapter::DeviceId id, PeripheralOptions opts = {});
    ~Peripheral() override;

    Peripheral(const Peripheral &)            = delete;
    Peripheral &operator=(const Peripheral &) = delete;

    const adapter::DeviceId &identifier() const { return id_; }
    std::string              name() const;

    State                    state() const { return state_.value(); }
    gattlink::Signal<State> &state_signal() { return state_; }

    // Copy of the catalog; nullopt until discovery has completed on the current connection.
    std::optional<std::vector<gatt::DiscoveredService>> services() const;

    Status connect(const gattlink::CancelToken &tok = {});
    Status disconnect(const gattlink::CancelToken &tok = {});

    Status read(const gatt::CharacteristicRef &ref, adapter::Bytes &out,
                const gattlink::CancelToken &tok = {});
    Status write(const gatt::CharacteristicRef &ref,
                 const adapter::Bytes          &data,
                 adapter::WriteType             type = adapter::WriteType::WithResponse,
                 const gattlink::CancelToken   &tok  = {});
    Status read(const gatt::DescriptorRef &ref, adapter::Bytes &out,
                const gattlink::CancelToken &tok = {});
    Status write(const gatt::DescriptorRef &ref, const adapter::Bytes &data,
                 const gattlink::CancelToken &tok = {});

    Status observe(const gatt::CharacteristicRef       &ref,
                   std::unique_ptr<gatt::Subscription> &out,
                   gatt::OnSubscription                 on_subscription = {},
                   const gattlink::CancelToken         &tok             = {});

    Status rssi(int &out, const gattlink::CancelToken &tok = {});

  private:
    struct Attempt;

    // gatt::NotificationControl
    Status enable_notifications(const gatt::CharacteristicRef &ref,
                                const gattlink::CancelToken   &tok) override;
    Status disable_notifications(const gatt::CharacteristicRef &ref,
                                 const gattlink::CancelToken   &tok) override;
    bool   is_connected() const override;

    // peripheral_connect.cpp
    void   run_attempt(const std::shared_ptr<Attempt> &a);
    Status establish_connection(Attempt &a);
    Status connect_sequence(const gattlink::CancelToken &tok);
    Status discover_services(Connection &conn, const gattlink::CancelToken &tok);
    void   close_connection();
    void   settle_link();
    void   set_disconnected();

    // peripheral.cpp
    void                                 on_event(const adapter::Event &e);
    void                                 on_link_down(std::optional<DisconnectStatus> reason);
    void                                 dispose_connection(const Status &why);
    void                                 set_state(const State &s);
    Status                               set_notify(const gatt::CharacteristicRef &ref, bool enabled,
                                                    const gattlink::CancelToken &tok);
    std::shared_ptr<Connection>          connection() const;
    std::shared_ptr<const gatt::Catalog> catalog() const;

    adapter::NativeAdapter &adapter_;
    const adapter::DeviceId id_;
    PeripheralOptions       opts_;

    gattlink::Signal<State> state_;
    // Native link requested or up; cleared only once its link-down event has been handled.
    gattlink::Signal<bool> native_link_{false};

    mutable std::mutex                   conn_mu_;  // guards connection_ and catalog_
    std::shared_ptr<Connection>          connection_;
    std::shared_ptr<const gatt::Catalog> catalog_;

    std::shared_ptr<gatt::ObservationRegistry> observers_;

    std::mutex               connect_mu_;  // guards attempt_
    std::shared_ptr<Attempt> attempt_;

    adapter::EventStream::Listener events_;
};

}  // namespace session
