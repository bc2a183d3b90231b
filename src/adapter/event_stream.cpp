#include <vector>

#include "adapter/event_stream.hpp"

namespace adapter
{

const char *to_string(PowerState s)
{
    switch (s)
    {
        case PowerState::Unknown:
            return "Unknown";
        case PowerState::Resetting:
            return "Resetting";
        case PowerState::Unsupported:
            return "Unsupported";
        case PowerState::Unauthorized:
            return "Unauthorized";
        case PowerState::PoweredOff:
            return "PoweredOff";
        case PowerState::PoweredOn:
            return "PoweredOn";
    }
    return "Unknown";
}

const char *to_string(ResponseKind k)
{
    switch (k)
    {
        case ResponseKind::ServicesDiscovered:
            return "ServicesDiscovered";
        case ResponseKind::CharacteristicsDiscovered:
            return "CharacteristicsDiscovered";
        case ResponseKind::DescriptorsDiscovered:
            return "DescriptorsDiscovered";
        case ResponseKind::CharacteristicWritten:
            return "CharacteristicWritten";
        case ResponseKind::DescriptorRead:
            return "DescriptorRead";
        case ResponseKind::DescriptorWritten:
            return "DescriptorWritten";
        case ResponseKind::NotifyStateUpdated:
            return "NotifyStateUpdated";
        case ResponseKind::RssiRead:
            return "RssiRead";
    }
    return "?";
}

EventStream::Listener::Listener(Listener &&o) noexcept : core_(std::move(o.core_)), id_(o.id_)
{
    o.id_ = 0;
}

EventStream::Listener &EventStream::Listener::operator=(Listener &&o) noexcept
{
    if (this != &o)
    {
        reset();
        core_ = std::move(o.core_);
        id_   = o.id_;
        o.id_ = 0;
    }
    return *this;
}

EventStream::Listener::~Listener()
{
    reset();
}

void EventStream::Listener::reset()
{
    auto core = core_.lock();
    if (core && id_ != 0)
    {
        {
            std::lock_guard<std::mutex> lk(core->mu);
            core->listeners.erase(id_);
        }
        // Wait out a publish() in progress on another thread. Recursive, so a callback
        // detaching itself does not deadlock.
        std::lock_guard<std::recursive_mutex> wait(core->dispatch_mu);
    }
    core_.reset();
    id_ = 0;
}

EventStream::EventStream() : core_(std::make_shared<StreamCore>()) {}

EventStream::Listener EventStream::listen(Callback cb)
{
    std::lock_guard<std::mutex> lk(core_->mu);
    const std::uint64_t         id = core_->next_id++;
    core_->listeners.emplace(id, std::make_shared<Callback>(std::move(cb)));
    return Listener(core_, id);
}

void EventStream::publish(const Event &e)
{
    std::lock_guard<std::recursive_mutex> dispatch(core_->dispatch_mu);

    std::vector<std::pair<std::uint64_t, std::shared_ptr<Callback>>> snapshot;
    {
        std::lock_guard<std::mutex> lk(core_->mu);
        snapshot.assign(core_->listeners.begin(), core_->listeners.end());
    }
    for (auto &entry : snapshot)
    {
        // skip listeners detached by an earlier callback of this same publish
        {
            std::lock_guard<std::mutex> lk(core_->mu);
            if (core_->listeners.find(entry.first) == core_->listeners.end())
                continue;
        }
        (*entry.second)(e);
    }
}

}  // namespace adapter
