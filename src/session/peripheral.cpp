#include "session/peripheral.hpp"
#include "gatt/descriptor_value.hpp"
#include "util/log.hpp"

namespace session
{

namespace
{
Status not_ready(const adapter::DeviceId &id, const char *what)
{
    return Status::error(Errc::NotReady, id + ": " + what);
}

// Operation failures are the caller's business; log them once here.
Status report(const adapter::DeviceId &id, const char *op, Status st)
{
    if (!st && st.code != Errc::Cancelled)
        LOG_WARN("[SESSION] %s: %s failed: %s", id.c_str(), op, to_string(st).c_str());
    return st;
}
}  // namespace

Peripheral::Peripheral(adapter::NativeAdapter &adapter, adapter::DeviceId id, PeripheralOptions opts)
    : adapter_(adapter),
      id_(std::move(id)),
      opts_(std::move(opts)),
      state_(State::disconnected())
{
    observers_ = std::make_shared<gatt::ObservationRegistry>(
        static_cast<gatt::NotificationControl &>(*this), opts_.on_observation_error);
    events_ = adapter_.events().listen([this](const adapter::Event &e) {
        if (e.device == id_)
            on_event(e);
    });
}

std::string Peripheral::name() const
{
    return adapter_.name(id_);
}

std::optional<std::vector<gatt::DiscoveredService>> Peripheral::services() const
{
    auto cat = catalog();
    if (!cat)
        return std::nullopt;
    return cat->services();
}

std::shared_ptr<Connection> Peripheral::connection() const
{
    std::lock_guard<std::mutex> lk(conn_mu_);
    return connection_;
}

std::shared_ptr<const gatt::Catalog> Peripheral::catalog() const
{
    std::lock_guard<std::mutex> lk(conn_mu_);
    return catalog_;
}

void Peripheral::set_state(const State &s)
{
    state_.set(s);
    LOG_SYSTEM("[SESSION] %s: %s", id_.c_str(), to_string(s).c_str());
}

// Per-device native events: link state drives the status, values feed the observers.
void Peripheral::on_event(const adapter::Event &e)
{
    using Type = adapter::Event::Type;
    switch (e.type)
    {
        case Type::Connected:
        {
            const State next = state_.update([](const State &s) {
                return s.is_connecting(ConnectPhase::LinkEstablishing)
                           ? State::connecting(ConnectPhase::DiscoveringServices)
                           : s;
            });
            if (next.is_connecting(ConnectPhase::DiscoveringServices))
                LOG_SYSTEM("[SESSION] %s: %s", id_.c_str(), to_string(next).c_str());
            return;
        }
        case Type::ConnectFailed:
        case Type::Disconnected:
            on_link_down(decode_disconnect_code(e.code));
            native_link_.set(false);
            return;
        case Type::ValueUpdated:
        {
            auto cat = catalog();
            if (!cat)
                return;
            const gatt::DiscoveredCharacteristic *chr = cat->find_by_handle(e.handle);
            if (chr)
                observers_->on_value(chr->ref(), e.bytes, e.error);
            return;
        }
        case Type::Response:
        case Type::PowerStateChanged:
        case Type::WriteWithoutResponseReady:
            return;
    }
}

// The handle goes first: nobody may see Disconnected while a Connection is still reachable.
void Peripheral::on_link_down(std::optional<DisconnectStatus> reason)
{
    const State prev     = state_.value();
    const bool  had_link = !prev.is_disconnected() &&
                          !prev.is_connecting(ConnectPhase::LinkEstablishing);

    dispose_connection(Status::connection_lost(reason, id_ + " disconnected"));
    if (had_link)
        observers_->on_disconnected();
    set_state(State::disconnected(reason));
}

void Peripheral::dispose_connection(const Status &why)
{
    std::shared_ptr<Connection> conn;
    {
        std::lock_guard<std::mutex> lk(conn_mu_);
        conn = std::move(connection_);
        connection_.reset();
        catalog_.reset();
    }
    if (conn)
        conn->close(why);
}

// ====== Operations ======

Status Peripheral::read(const gatt::CharacteristicRef &ref,
                        adapter::Bytes                &out,
                        const gattlink::CancelToken   &tok)
{
    LOG_DEBUG("[SESSION] %s: read %s", id_.c_str(), gatt::to_string(ref).c_str());
    auto cat = catalog();
    if (!cat)
        return not_ready(id_, "services have not been discovered");
    const gatt::DiscoveredCharacteristic *chr = nullptr;
    Status st = cat->obtain(ref, adapter::props::Read, chr);
    if (!st)
        return report(id_, "read", st);
    auto conn = connection();
    if (!conn)
        return not_ready(id_, "not connected");

    const adapter::Handle h = chr->handle;
    return report(id_, "read",
                  conn->read_value(h, [&] { return adapter_.read_characteristic(id_, h); }, out,
                                   tok));
}

Status Peripheral::write(const gatt::CharacteristicRef &ref,
                         const adapter::Bytes          &data,
                         adapter::WriteType             type,
                         const gattlink::CancelToken   &tok)
{
    const bool with_response = type == adapter::WriteType::WithResponse;
    LOG_DEBUG("[SESSION] %s: write %s (%zu bytes, %s)", id_.c_str(), gatt::to_string(ref).c_str(),
              data.size(), with_response ? "with response" : "without response");

    auto cat = catalog();
    if (!cat)
        return not_ready(id_, "services have not been discovered");
    const gatt::DiscoveredCharacteristic *chr = nullptr;
    Status st = cat->obtain(ref,
                            with_response ? adapter::props::Write
                                          : adapter::props::WriteWithoutResponse,
                            chr);
    if (!st)
        return report(id_, "write", st);
    auto conn = connection();
    if (!conn)
        return not_ready(id_, "not connected");

    const adapter::Handle h    = chr->handle;
    auto                  call = [&] { return adapter_.write_characteristic(id_, h, data, type); };
    if (with_response)
        return report(id_, "write",
                      conn->execute(adapter::ResponseKind::CharacteristicWritten, call, nullptr, tok));
    return report(id_, "write", conn->write_without_response(call, tok));
}

Status Peripheral::read(const gatt::DescriptorRef   &ref,
                        adapter::Bytes              &out,
                        const gattlink::CancelToken &tok)
{
    LOG_DEBUG("[SESSION] %s: read %s", id_.c_str(), gatt::to_string(ref).c_str());
    auto cat = catalog();
    if (!cat)
        return not_ready(id_, "services have not been discovered");
    const gatt::DiscoveredDescriptor *desc = nullptr;
    Status                            st   = cat->obtain(ref, desc);
    if (!st)
        return report(id_, "read", st);
    auto conn = connection();
    if (!conn)
        return not_ready(id_, "not connected");

    const adapter::Handle h = desc->handle;
    adapter::Event        ev;
    st = conn->execute(adapter::ResponseKind::DescriptorRead,
                       [&] { return adapter_.read_descriptor(id_, h); }, &ev, tok);
    if (!st)
        return report(id_, "read", st);
    out = gatt::normalize_descriptor_value(desc->uuid, ev.value);
    return st;
}

Status Peripheral::write(const gatt::DescriptorRef   &ref,
                         const adapter::Bytes        &data,
                         const gattlink::CancelToken &tok)
{
    LOG_DEBUG("[SESSION] %s: write %s (%zu bytes)", id_.c_str(), gatt::to_string(ref).c_str(),
              data.size());
    auto cat = catalog();
    if (!cat)
        return not_ready(id_, "services have not been discovered");
    const gatt::DiscoveredDescriptor *desc = nullptr;
    Status                            st   = cat->obtain(ref, desc);
    if (!st)
        return report(id_, "write", st);
    auto conn = connection();
    if (!conn)
        return not_ready(id_, "not connected");

    const adapter::Handle h = desc->handle;
    return report(id_, "write",
                  conn->execute(adapter::ResponseKind::DescriptorWritten,
                                [&] { return adapter_.write_descriptor(id_, h, data); }, nullptr,
                                tok));
}

Status Peripheral::observe(const gatt::CharacteristicRef       &ref,
                           std::unique_ptr<gatt::Subscription> &out,
                           gatt::OnSubscription                 on_subscription,
                           const gattlink::CancelToken         &tok)
{
    LOG_DEBUG("[SESSION] %s: observe %s", id_.c_str(), gatt::to_string(ref).c_str());
    return report(id_, "observe", observers_->acquire(ref, std::move(on_subscription), out, tok));
}

Status Peripheral::rssi(int &out, const gattlink::CancelToken &tok)
{
    auto conn = connection();
    if (!conn)
        return not_ready(id_, "not connected");
    adapter::Event ev;
    Status         st = conn->execute(adapter::ResponseKind::RssiRead,
                                      [&] { return adapter_.read_rssi(id_); }, &ev, tok);
    if (st)
        out = ev.rssi;
    return report(id_, "rssi", st);
}

// ====== Notification control (observation registry) ======

Status Peripheral::set_notify(const gatt::CharacteristicRef &ref,
                              bool                           enabled,
                              const gattlink::CancelToken   &tok)
{
    LOG_DEBUG("[SESSION] %s: %s %s", id_.c_str(), enabled ? "notify" : "cancel notify",
              gatt::to_string(ref).c_str());
    auto cat = catalog();
    if (!cat)
        return not_ready(id_, "services have not been discovered");
    const gatt::DiscoveredCharacteristic *chr = nullptr;
    Status st = cat->obtain(ref, adapter::props::Notify | adapter::props::Indicate, chr);
    if (!st)
        return st;
    auto conn = connection();
    if (!conn)
        return not_ready(id_, "not connected");

    const adapter::Handle h = chr->handle;
    return conn->execute(adapter::ResponseKind::NotifyStateUpdated,
                         [&] { return adapter_.set_notify(id_, h, enabled); }, nullptr, tok);
}

Status Peripheral::enable_notifications(const gatt::CharacteristicRef &ref,
                                        const gattlink::CancelToken   &tok)
{
    return set_notify(ref, true, tok);
}

Status Peripheral::disable_notifications(const gatt::CharacteristicRef &ref,
                                         const gattlink::CancelToken   &tok)
{
    return set_notify(ref, false, tok);
}

bool Peripheral::is_connected() const
{
    const State s = state_.value();
    if (!s.is_connected() && !s.is_connecting(ConnectPhase::ConfiguringObservations))
        return false;
    return static_cast<bool>(connection());
}

}  // namespace session
