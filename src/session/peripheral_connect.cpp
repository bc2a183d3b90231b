#include <chrono>
#include <condition_variable>
#include <cstring>
#include <thread>

#include "session/peripheral.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

/*
Connect attempt (one worker thread per attempt):

  connect() ──> [attempt running?] ──yes──> wait for its outcome
                       │ no
                       v
                 worker: power check ─> watchers on ─> Connecting(LinkEstablishing)
                         ─> native connect ─> wait DiscoveringServices ─> discovery walk
                         ─> on_services_discovered ─> ConfiguringObservations ─> Connected
                 any failure: watchers off ─> native cancel (shielded) ─> dispose ─> Disconnected

Watchers abort the attempt by cancelling its token and recording why; the worker does the
cleanup, never the watcher callbacks.
*/

namespace session
{

struct Peripheral::Attempt
{
    std::mutex              mu;
    std::condition_variable cv;
    bool                    done    = false;
    bool                    aborted = false;
    Status                  result;
    Status                  abort_status;
    gattlink::CancelSource  cancel;
    std::thread             worker;

    // First abort wins; the attempt token fires once.
    void abort(const Status &why)
    {
        {
            std::lock_guard<std::mutex> lk(mu);
            if (done || aborted)
                return;
            aborted      = true;
            abort_status = why;
        }
        cancel.cancel();
    }

    bool abort_reason(Status &out)
    {
        std::lock_guard<std::mutex> lk(mu);
        if (aborted)
            out = abort_status;
        return aborted;
    }

    void finish(const Status &st)
    {
        {
            std::lock_guard<std::mutex> lk(mu);
            done   = true;
            result = st;
        }
        cv.notify_all();
    }

    bool finished()
    {
        std::lock_guard<std::mutex> lk(mu);
        return done;
    }

    Status wait(const gattlink::CancelToken &tok)
    {
        bool                         cancelled = false;
        gattlink::CancelRegistration reg(tok, [this, &cancelled] {
            std::lock_guard<std::mutex> lk(mu);
            cancelled = true;
            cv.notify_all();
        });
        std::unique_lock<std::mutex> lk(mu);
        cv.wait(lk, [&] { return done || cancelled; });
        if (done)
            return result;
        return Status::cancelled();
    }
};

// ====== Function: connect
// - In: caller token (only stops this caller from waiting)
// - Out: outcome of the shared attempt
// - Note: returns at once when already connected; otherwise joins the attempt in flight or
//         starts one. A cancelled caller leaves the attempt running for the others.
Status Peripheral::connect(const gattlink::CancelToken &tok)
{
    std::shared_ptr<Attempt> a;
    {
        std::lock_guard<std::mutex> lk(connect_mu_);
        if (state_.value().is_connected() && connection())
            return Status::success();

        if (!attempt_ || attempt_->finished())
        {
            if (attempt_ && attempt_->worker.joinable())
                attempt_->worker.join();
            attempt_         = std::make_shared<Attempt>();
            auto fresh       = attempt_;
            attempt_->worker = std::thread([this, fresh] { run_attempt(fresh); });
        }
        a = attempt_;
    }
    return a->wait(tok);
}

void Peripheral::run_attempt(const std::shared_ptr<Attempt> &a)
{
    a->finish(establish_connection(*a));
}

Status Peripheral::establish_connection(Attempt &a)
{
    const gattlink::CancelToken tok = a.cancel.token();

    const adapter::PowerState power = adapter_.power_state();
    if (power != adapter::PowerState::PoweredOn)
    {
        Status st = Status::error(Errc::AdapterDisabled,
                                  std::string("Bluetooth state is ") + adapter::to_string(power) +
                                      ", but PoweredOn was required");
        LOG_WARN("[SESSION] %s: %s", id_.c_str(), st.message.c_str());
        return st;
    }

    // Adapter-loss watcher
    adapter::EventStream::Listener power_watch =
        adapter_.events().listen([this, &a](const adapter::Event &e) {
            if (e.type != adapter::Event::Type::PowerStateChanged ||
                e.power == adapter::PowerState::PoweredOn)
                return;
            LOG_INFO("[SESSION] %s: Bluetooth unavailable (%s)", id_.c_str(),
                     adapter::to_string(e.power));
            a.abort(Status::error(Errc::AdapterUnavailable,
                                  id_ + " " + adapter::to_string(e.power)));
        });

    LOG_INFO("[SESSION] %s: Connecting", id_.c_str());
    set_state(State::connecting(ConnectPhase::LinkEstablishing));

    // Link failure watcher
    adapter::EventStream::Listener failure_watch =
        adapter_.events().listen([this, &a](const adapter::Event &e) {
            if (e.device != id_)
                return;
            if (e.type != adapter::Event::Type::ConnectFailed &&
                e.type != adapter::Event::Type::Disconnected)
                return;
            const auto  why    = decode_disconnect_code(e.code);
            std::string detail = why ? ": " + to_string(*why) : std::string();
            LOG_INFO("[SESSION] %s: Disconnected%s", id_.c_str(), detail.c_str());
            a.abort(Status::connection_lost(why, id_ + " disconnected" + detail));
        });

    Status st = connect_sequence(tok);

    power_watch.reset();
    failure_watch.reset();

    if (!st)
    {
        Status cause;
        if (a.abort_reason(cause))
            st = cause;
        close_connection();
        settle_link();
        dispose_connection(st);
        set_disconnected();
        LOG_ERROR("[SESSION] %s: Failed to connect: %s", id_.c_str(), to_string(st).c_str());
    }
    return st;
}

Status Peripheral::connect_sequence(const gattlink::CancelToken &tok)
{
    auto conn = std::make_shared<Connection>(adapter_, id_);
    {
        std::lock_guard<std::mutex> lk(conn_mu_);
        connection_ = conn;
    }

    // Raised first: the link-down event may arrive before connect() returns.
    native_link_.set(true);
    const int r = adapter_.connect(id_);
    if (r < 0)
    {
        native_link_.set(false);
        return Status::io_failure(r, std::string("Native connect failed: ") + std::strerror(-r));
    }

    State s;
    if (!state_.wait_until(
            [](const State &v) { return !v.is_connecting(ConnectPhase::LinkEstablishing); }, tok,
            &s))
        return Status::cancelled();
    if (!s.is_connecting(ConnectPhase::DiscoveringServices))
        return Status::connection_lost(s.status, id_ + " disconnected while connecting");

    Status st = discover_services(*conn, tok);
    if (!st)
        return st;

    if (opts_.on_services_discovered)
    {
        st = opts_.on_services_discovered(*this, tok);
        if (!st)
            return st;
    }

    const State cfg = state_.update([](const State &v) {
        return v.is_connecting(ConnectPhase::DiscoveringServices)
                   ? State::connecting(ConnectPhase::ConfiguringObservations)
                   : v;
    });
    if (!cfg.is_connecting(ConnectPhase::ConfiguringObservations))
        return Status::connection_lost(cfg.status, id_ + " disconnected while connecting");
    LOG_SYSTEM("[SESSION] %s: %s", id_.c_str(), to_string(cfg).c_str());
    LOG_DEBUG("[SESSION] %s: Configuring characteristic observations", id_.c_str());
    st = observers_->on_connected(tok);
    if (!st)
        return st;
    if (tok.cancelled())
        return Status::cancelled();

    const State next = state_.update([](const State &v) {
        return v.is_connecting(ConnectPhase::ConfiguringObservations) ? State::connected() : v;
    });
    if (!next.is_connected())
        return Status::connection_lost(next.status, id_ + " disconnected while connecting");
    LOG_SYSTEM("[SESSION] %s: %s", id_.c_str(), to_string(next).c_str());
    return Status::success();
}

// ====== Function: discover_services
// - In: the fresh connection, attempt token
// - Out: catalog_ published from the native tree once the whole walk succeeded
// - Note: services -> characteristics per service -> descriptors per characteristic, each
//         step one serialized command; any failure leaves no catalog behind.
Status Peripheral::discover_services(Connection &conn, const gattlink::CancelToken &tok)
{
    LOG_DEBUG("[SESSION] %s: discoverServices (filter=%zu)", id_.c_str(),
              opts_.service_filter.size());

    adapter::Event ev;
    Status         st = conn.execute(
        adapter::ResponseKind::ServicesDiscovered,
        [&] { return adapter_.discover_services(id_, opts_.service_filter); }, &ev, tok);
    if (!st)
        return st;
    const int mtu = ev.mtu > 0 ? ev.mtu : constants::DEFAULT_ATT_MTU;
    LOG_DEBUG("[SESSION] %s: MTU %d", id_.c_str(), mtu);
    if (opts_.on_mtu_changed)
        opts_.on_mtu_changed(mtu);

    for (const auto &svc : adapter_.services(id_))
    {
        st = conn.execute(
            adapter::ResponseKind::CharacteristicsDiscovered,
            [&] { return adapter_.discover_characteristics(id_, svc.handle); }, nullptr, tok);
        if (!st)
            return st;

        for (const auto &fresh : adapter_.services(id_))
        {
            if (fresh.handle != svc.handle)
                continue;
            for (const auto &chr : fresh.characteristics)
            {
                st = conn.execute(
                    adapter::ResponseKind::DescriptorsDiscovered,
                    [&] { return adapter_.discover_descriptors(id_, chr.handle); }, nullptr, tok);
                if (!st)
                    return st;
            }
        }
    }

    auto cat = std::make_shared<const gatt::Catalog>(adapter_.services(id_));
    {
        std::lock_guard<std::mutex> lk(conn_mu_);
        if (connection_.get() != &conn)
            return Status::connection_lost(std::nullopt, id_ + " disconnected during discovery");
        catalog_ = std::move(cat);
    }
    LOG_INFO("[SESSION] %s: %zu services discovered", id_.c_str(), catalog()->services().size());
    return Status::success();
}

// ====== Function: disconnect
// - Note: native teardown is issued without the caller token; only the wait for Disconnected
//         can be cancelled.
Status Peripheral::disconnect(const gattlink::CancelToken &tok)
{
    {
        std::lock_guard<std::mutex> lk(connect_mu_);
        if (attempt_)
            attempt_->abort(Status::connection_lost(std::nullopt, id_ + " disconnect requested"));
    }

    const State closing = state_.update(
        [](const State &s) { return s.is_connected() ? State::disconnecting() : s; });
    if (closing.kind == State::Kind::Disconnecting)
        LOG_SYSTEM("[SESSION] %s: %s", id_.c_str(), to_string(closing).c_str());

    close_connection();

    if (!state_.wait_until([](const State &s) { return s.is_disconnected(); }, tok))
        return Status::cancelled();
    settle_link();
    LOG_INFO("[SESSION] %s: Disconnected", id_.c_str());
    return Status::success();
}

// Shielded: never takes a caller token. When the stack cannot tear down, settle locally.
void Peripheral::close_connection()
{
    const int r = adapter_.cancel_connection(id_);
    if (r < 0)
    {
        LOG_WARN("[SESSION] %s: cancel_connection failed: %s", id_.c_str(), std::strerror(-r));
        on_link_down(std::nullopt);
        native_link_.set(false);
    }
}

// ====== Function: settle_link
// - Note: waits for the link-down event of the teardown just requested, so a late event from
//         this link cannot reach the next attempt. Shielded and bounded by TEARDOWN_SETTLE_MS.
void Peripheral::settle_link()
{
    if (native_link_.wait_for([](bool up) { return !up; },
                              std::chrono::milliseconds(constants::TEARDOWN_SETTLE_MS)))
        return;
    LOG_WARN("[SESSION] %s: native stack did not confirm the teardown within %d ms", id_.c_str(),
             constants::TEARDOWN_SETTLE_MS);
    native_link_.set(false);
}

// Keeps an existing Disconnected (and its reason).
void Peripheral::set_disconnected()
{
    const State prev = state_.value();
    const State next =
        state_.update([](const State &s) { return s.is_disconnected() ? s : State::disconnected(); });
    if (!prev.is_disconnected())
        LOG_SYSTEM("[SESSION] %s: %s", id_.c_str(), to_string(next).c_str());
}

Peripheral::~Peripheral()
{
    std::shared_ptr<Attempt> a;
    {
        std::lock_guard<std::mutex> lk(connect_mu_);
        a = attempt_;
    }
    if (a)
        a->abort(Status::connection_lost(std::nullopt, id_ + " disposed"));
    close_connection();
    if (a && a->worker.joinable())
        a->worker.join();

    events_.reset();
    dispose_connection(Status::error(Errc::NotReady, id_ + " disposed"));
    set_disconnected();
    observers_->shutdown();
    LOG_INFO("[SESSION] %s: disposed", id_.c_str());
}

}  // namespace session
