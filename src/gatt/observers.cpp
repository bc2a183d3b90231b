#include <condition_variable>
#include <deque>
#include <utility>
#include <vector>

#include "gatt/observers.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace gatt
{

struct ObservationSink
{
    std::mutex                   mu;
    std::condition_variable      cv;
    std::deque<ObservationEvent> queue;
    bool                         closed     = false;
    bool                         overflowed = false;

    void push(const ObservationEvent &ev)
    {
        {
            std::lock_guard<std::mutex> lk(mu);
            if (closed)
                return;
            if (queue.size() >= constants::OBSERVATION_BACKLOG)
            {
                if (!overflowed)
                    LOG_WARN("[OBS] Subscriber not draining, dropping oldest events");
                overflowed = true;
                queue.pop_front();
            }
            queue.push_back(ev);
        }
        cv.notify_all();
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lk(mu);
            closed = true;
        }
        cv.notify_all();
    }
};

// ====== Subscription ======

Subscription::Subscription(std::weak_ptr<ObservationRegistry> owner,
                           CharacteristicRef                  ref,
                           std::uint64_t                      id,
                           std::shared_ptr<ObservationSink>   sink)
    : owner_(std::move(owner)), ref_(std::move(ref)), id_(id), sink_(std::move(sink))
{
}

Subscription::~Subscription()
{
    if (auto reg = owner_.lock())
        reg->release(ref_, id_);
}

session::Status Subscription::next(ObservationEvent &out, const gattlink::CancelToken &tok)
{
    bool                         cancelled = false;
    gattlink::CancelRegistration reg(tok, [sink = sink_, &cancelled] {
        std::lock_guard<std::mutex> lk(sink->mu);
        cancelled = true;
        sink->cv.notify_all();
    });
    std::unique_lock<std::mutex> lk(sink_->mu);
    sink_->cv.wait(lk, [&] { return !sink_->queue.empty() || sink_->closed || cancelled; });

    if (!sink_->queue.empty())
    {
        out = std::move(sink_->queue.front());
        sink_->queue.pop_front();
        return session::Status::success();
    }
    if (sink_->closed)
        return session::Status::error(session::Errc::NotReady, "Observation closed");
    return session::Status::cancelled();
}

bool Subscription::next_for(ObservationEvent &out, std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lk(sink_->mu);
    sink_->cv.wait_for(lk, timeout, [&] { return !sink_->queue.empty() || sink_->closed; });
    if (sink_->queue.empty())
        return false;
    out = std::move(sink_->queue.front());
    sink_->queue.pop_front();
    return true;
}

// ====== ObservationRegistry ======

ObservationRegistry::ObservationRegistry(NotificationControl &ctl, ObservationErrorHandler on_error)
    : ctl_(ctl), on_error_(std::move(on_error))
{
    if (!on_error_)
        on_error_ = [](const CharacteristicRef &, const session::Status &st) { return st; };
}

// ====== Function: acquire
// - In: characteristic, optional on_subscription action, caller token
// - Out: a live Subscription in `out`
// - Note: the first subscriber arms notifications when a connection is up; otherwise arming
//         waits for on_connected(). on_subscription runs for this subscriber once armed.
session::Status ObservationRegistry::acquire(const CharacteristicRef       &ref,
                                             OnSubscription                 on_subscription,
                                             std::unique_ptr<Subscription> &out,
                                             const gattlink::CancelToken   &tok)
{
    std::lock_guard<std::mutex> arm(arm_mu_);

    const std::string key   = canonical_key(ref);
    auto              sink  = std::make_shared<ObservationSink>();
    std::uint64_t     id    = 0;
    bool              first = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (shut_)
            return session::Status::error(session::Errc::NotReady, "Peripheral closed");
        id        = next_id_++;
        auto &obs = observations_[key];
        if (obs.subscribers.empty())
        {
            obs.ref = ref;
            first   = true;
        }
        obs.subscribers.emplace(id, Subscriber{sink, on_subscription});
    }
    out.reset(new Subscription(weak_from_this(), ref, id, sink));

    if (!ctl_.is_connected())
    {
        LOG_DEBUG("[OBS] %s queued until connected", to_string(ref).c_str());
        return session::Status::success();
    }

    session::Status st    = session::Status::success();
    bool            armed = false;
    if (first)
    {
        st    = ctl_.enable_notifications(ref, tok);
        armed = st.ok();
    }
    if (st && on_subscription)
        st = on_subscription(tok);
    if (!st)
    {
        LOG_WARN("[OBS] Failed to start observation of %s: %s", to_string(ref).c_str(),
                 session::to_string(st).c_str());
        // Drop the subscriber without going through release(): arm_mu_ is held here.
        bool              last = false;
        CharacteristicRef armed_ref;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto                        it = observations_.find(key);
            if (it != observations_.end())
            {
                it->second.subscribers.erase(id);
                if (it->second.subscribers.empty())
                {
                    armed_ref = it->second.ref;
                    observations_.erase(it);
                    last = true;
                }
            }
        }
        out->owner_.reset();
        out.reset();
        if (last && armed)
        {
            session::Status off = ctl_.disable_notifications(armed_ref, gattlink::CancelToken{});
            if (!off)
                LOG_WARN("[OBS] Failed to stop notifications on %s: %s",
                         to_string(armed_ref).c_str(), session::to_string(off).c_str());
        }
        return st;
    }
    LOG_DEBUG("[OBS] %s observed%s", to_string(ref).c_str(), first ? " (armed)" : "");
    return session::Status::success();
}

session::Status ObservationRegistry::on_connected(const gattlink::CancelToken &tok)
{
    std::lock_guard<std::mutex> arm(arm_mu_);

    std::vector<std::pair<CharacteristicRef, std::vector<OnSubscription>>> todo;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto &kv : observations_)
        {
            std::vector<OnSubscription> actions;
            for (const auto &sub : kv.second.subscribers)
            {
                if (sub.second.on_subscription)
                    actions.push_back(sub.second.on_subscription);
            }
            todo.emplace_back(kv.second.ref, std::move(actions));
        }
    }

    for (const auto &item : todo)
    {
        session::Status st = ctl_.enable_notifications(item.first, tok);
        for (size_t i = 0; st && i < item.second.size(); ++i)
            st = item.second[i](tok);
        if (st)
            continue;

        LOG_WARN("[OBS] Re-arming %s failed: %s", to_string(item.first).c_str(),
                 session::to_string(st).c_str());
        if (st.code == session::Errc::Cancelled)
            return st;
        session::Status handled = on_error_(item.first, st);
        if (!handled)
            return handled;
    }
    return session::Status::success();
}

void ObservationRegistry::on_disconnected()
{
    ObservationEvent ev;
    ev.type = ObservationEvent::Type::Disconnected;

    std::lock_guard<std::mutex> lk(mu_);
    for (const auto &kv : observations_)
        broadcast(kv.second, ev);
}

void ObservationRegistry::on_value(const CharacteristicRef                   &ref,
                                   const adapter::Bytes                      &value,
                                   const std::optional<adapter::NativeError> &error)
{
    ObservationEvent ev;
    if (error)
    {
        ev.type    = ObservationEvent::Type::Error;
        ev.code    = error->code;
        ev.message = error->message;
    }
    else
    {
        ev.type  = ObservationEvent::Type::Value;
        ev.value = value;
    }

    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = observations_.find(canonical_key(ref));
    if (it == observations_.end())
        return;
    broadcast(it->second, ev);
}

void ObservationRegistry::shutdown()
{
    std::lock_guard<std::mutex> arm(arm_mu_);
    std::lock_guard<std::mutex> lk(mu_);
    if (shut_)
        return;
    shut_ = true;
    for (auto &kv : observations_)
    {
        for (auto &sub : kv.second.subscribers)
            sub.second.sink->close();
    }
    observations_.clear();
}

std::size_t ObservationRegistry::observation_count() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return observations_.size();
}

void ObservationRegistry::release(const CharacteristicRef &ref, std::uint64_t id)
{
    std::lock_guard<std::mutex> arm(arm_mu_);

    bool              last = false;
    CharacteristicRef armed_ref;  // the spelling notifications were armed with
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (shut_)
            return;
        auto it = observations_.find(canonical_key(ref));
        if (it == observations_.end())
            return;
        it->second.subscribers.erase(id);
        if (it->second.subscribers.empty())
        {
            armed_ref = it->second.ref;
            observations_.erase(it);
            last = true;
        }
    }

    if (!last || !ctl_.is_connected())
        return;

    // Not bound to any caller: the subscriber is already gone.
    session::Status st = ctl_.disable_notifications(armed_ref, gattlink::CancelToken{});
    if (!st)
        LOG_WARN("[OBS] Failed to stop notifications on %s: %s", to_string(armed_ref).c_str(),
                 session::to_string(st).c_str());
    else
        LOG_DEBUG("[OBS] %s released (disarmed)", to_string(armed_ref).c_str());
}

void ObservationRegistry::broadcast(const Observation &obs, const ObservationEvent &ev)
{
    for (const auto &sub : obs.subscribers)
        sub.second.sink->push(ev);
}

}  // namespace gatt
