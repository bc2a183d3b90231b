#include <algorithm>
#include <cctype>
#include <cerrno>

#include "adapter/fake_adapter.hpp"
#include "util/log.hpp"

/*
FakeAdapter command flow (no radio):

  connect()            --> Connected                  | fault: ConnectFailed(code) / nothing
  discover_*()         --> Response(kind, handle)     | fault: Response+error / nothing / Disconnected(code)
  read_characteristic  --> ValueUpdated(handle, bytes)
  write (with resp.)   --> Response(CharacteristicWritten)
  write (without)      --> (nothing; readiness via set_write_ready)
  cancel_connection()  --> Disconnected(0) when a link is pending or up

With a response delay every event goes through one worker thread, in submission order.
*/

namespace adapter
{

namespace
{
std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
}  // namespace

FakeAdapter::FakeAdapter() = default;

FakeAdapter::~FakeAdapter()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable())
        worker_.join();
}

// ---- scripting ----

void FakeAdapter::set_services(const DeviceId &dev, std::vector<NativeService> tree)
{
    std::lock_guard<std::mutex> lk(mu_);
    devices_[dev].tree = std::move(tree);
}

void FakeAdapter::set_device_name(const DeviceId &dev, std::string name)
{
    std::lock_guard<std::mutex> lk(mu_);
    devices_[dev].name = std::move(name);
}

void FakeAdapter::set_power_state(PowerState s)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        power_ = s;
    }
    LOG_DEBUG("[FAKE] power -> %s", to_string(s));
    deliver(Event::power_changed(s), false);
}

void FakeAdapter::set_mtu(int mtu)
{
    std::lock_guard<std::mutex> lk(mu_);
    mtu_ = mtu;
}

void FakeAdapter::set_rssi(int rssi)
{
    std::lock_guard<std::mutex> lk(mu_);
    rssi_ = rssi;
}

void FakeAdapter::set_characteristic_value(const Handle &h, Bytes v)
{
    std::lock_guard<std::mutex> lk(mu_);
    char_values_[h] = std::move(v);
}

void FakeAdapter::set_descriptor_value(const Handle &h, NativeValue v)
{
    std::lock_guard<std::mutex> lk(mu_);
    desc_values_[h] = std::move(v);
}

void FakeAdapter::set_write_ready(const DeviceId &dev, bool ready)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        devices_[dev].wwr_ready = ready;
    }
    if (ready)
        deliver(Event::link(Event::Type::WriteWithoutResponseReady, dev), false);
}

void FakeAdapter::set_response_delay(std::chrono::milliseconds d)
{
    std::lock_guard<std::mutex> lk(mu_);
    delay_ = d;
    if (d.count() > 0 && !worker_.joinable())
        worker_ = std::thread([this] { worker_loop(); });
}

void FakeAdapter::inject(const std::string &command, Fault f, int code)
{
    std::lock_guard<std::mutex> lk(mu_);
    faults_[command].push_back(Injected{f, code});
}

void FakeAdapter::emit_value(const DeviceId &dev, const Handle &h, Bytes v)
{
    deliver(Event::value_updated(dev, h, std::move(v)), false);
}

void FakeAdapter::drop_link(const DeviceId &dev, int code)
{
    Event::Type t;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto                        it = devices_.find(dev);
        if (it == devices_.end() || (!it->second.linked && !it->second.pending))
            return;
        t                     = it->second.linked ? Event::Type::Disconnected : Event::Type::ConnectFailed;
        it->second.linked     = false;
        it->second.pending    = false;
        it->second.discovered = false;
        notifying_.clear();
    }
    LOG_DEBUG("[FAKE] link to %s dropped (code=0x%02x)", dev.c_str(), code);
    deliver(Event::link(t, dev, code), false);
}

// ---- inspection ----

int FakeAdapter::calls(const std::string &command) const
{
    std::lock_guard<std::mutex> lk(mu_);
    return static_cast<int>(std::count(log_.begin(), log_.end(), command));
}

std::vector<std::string> FakeAdapter::call_log() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return log_;
}

int FakeAdapter::max_inflight() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return max_inflight_;
}

bool FakeAdapter::notifying(const Handle &h) const
{
    std::lock_guard<std::mutex> lk(mu_);
    return notifying_.count(h) != 0;
}

std::vector<Bytes> FakeAdapter::writes(const Handle &h) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = writes_.find(h);
    return it == writes_.end() ? std::vector<Bytes>{} : it->second;
}

bool FakeAdapter::linked(const DeviceId &dev) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = devices_.find(dev);
    return it != devices_.end() && it->second.linked;
}

// ---- helpers ----

void FakeAdapter::note_call(const std::string &cmd)
{
    log_.push_back(cmd);
}

bool FakeAdapter::take_fault(const std::string &cmd, Injected &out)
{
    auto it = faults_.find(cmd);
    if (it == faults_.end() || it->second.empty())
        return false;
    out = it->second.front();
    it->second.pop_front();
    return true;
}

void FakeAdapter::start_op()
{
    ++inflight_;
    max_inflight_ = std::max(max_inflight_, inflight_);
}

void FakeAdapter::deliver(Event e, bool completes)
{
    std::unique_lock<std::mutex> lk(mu_);
    if (delay_.count() > 0 && !stop_)
    {
        queue_.push_back(Delivery{std::move(e), completes, std::chrono::steady_clock::now() + delay_});
        lk.unlock();
        cv_.notify_all();
        return;
    }
    if (completes)
        --inflight_;
    lk.unlock();
    events_.publish(e);
}

int FakeAdapter::complete(const std::string &cmd, const DeviceId &dev, Event ok_event)
{
    Injected f{};
    bool     faulted = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        faulted = take_fault(cmd, f);
        if (faulted && f.fault == Fault::Drop)
        {
            LOG_DEBUG("[FAKE] %s: dropping completion", cmd.c_str());
            return 0;
        }
        if (faulted && f.fault == Fault::Disconnect)
        {
            auto &d      = devices_[dev];
            d.linked     = false;
            d.pending    = false;
            d.discovered = false;
            notifying_.clear();
        }
        else
        {
            start_op();
        }
    }

    if (faulted && f.fault == Fault::Disconnect)
    {
        LOG_DEBUG("[FAKE] %s: link drops instead (code=0x%02x)", cmd.c_str(), f.code);
        deliver(Event::link(Event::Type::Disconnected, dev, f.code), false);
        return 0;
    }
    if (faulted)
        ok_event.error = NativeError{f.code, cmd + " failed (injected)"};
    deliver(std::move(ok_event), true);
    return 0;
}

void FakeAdapter::worker_loop()
{
    std::unique_lock<std::mutex> lk(mu_);
    for (;;)
    {
        cv_.wait(lk, [&] { return stop_ || !queue_.empty(); });
        if (stop_)
            return;
        const auto due = queue_.front().due;
        if (cv_.wait_until(lk, due, [&] { return stop_; }))
            return;

        Delivery d = std::move(queue_.front());
        queue_.pop_front();
        if (d.completes)
            --inflight_;
        lk.unlock();
        events_.publish(d.event);
        lk.lock();
    }
}

// ---- NativeAdapter ----

PowerState FakeAdapter::power_state() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return power_;
}

int FakeAdapter::connect(const DeviceId &dev)
{
    Injected f{};
    bool     faulted = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        note_call("connect");
        if (power_ != PowerState::PoweredOn)
            return -ENODEV;
        auto &d = devices_[dev];
        if (d.linked)
            return -EALREADY;
        faulted = take_fault("connect", f);
        if (faulted && f.fault == Fault::Drop)
        {
            d.pending = true;
            return 0;
        }
        d.pending = false;
        d.linked  = !faulted;
    }

    if (faulted)
    {
        const int code = f.code != 0 ? f.code : 0x3E;
        LOG_DEBUG("[FAKE] connect %s fails (code=0x%02x)", dev.c_str(), code);
        deliver(Event::link(Event::Type::ConnectFailed, dev, code), false);
        return 0;
    }
    deliver(Event::link(Event::Type::Connected, dev), false);
    return 0;
}

int FakeAdapter::cancel_connection(const DeviceId &dev)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        note_call("cancel_connection");
        auto it = devices_.find(dev);
        if (it == devices_.end() || (!it->second.linked && !it->second.pending))
            return 0;
        it->second.linked     = false;
        it->second.pending    = false;
        it->second.discovered = false;
        notifying_.clear();
    }
    deliver(Event::link(Event::Type::Disconnected, dev, 0), false);
    return 0;
}

int FakeAdapter::discover_services(const DeviceId &dev, const std::vector<std::string> &filter)
{
    Event e = Event::response(dev, ResponseKind::ServicesDiscovered);
    {
        std::lock_guard<std::mutex> lk(mu_);
        note_call("discover_services");
        auto &d = devices_[dev];
        if (!d.linked)
            return -ENOTCONN;
        d.filter.clear();
        for (const auto &u : filter)
            d.filter.push_back(lower(u));
        d.discovered = true;
        e.mtu        = mtu_;
    }
    return complete("discover_services", dev, std::move(e));
}

int FakeAdapter::discover_characteristics(const DeviceId &dev, const Handle &service)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        note_call("discover_characteristics");
        if (!devices_[dev].linked)
            return -ENOTCONN;
    }
    return complete("discover_characteristics", dev,
                    Event::response(dev, ResponseKind::CharacteristicsDiscovered, service));
}

int FakeAdapter::discover_descriptors(const DeviceId &dev, const Handle &characteristic)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        note_call("discover_descriptors");
        if (!devices_[dev].linked)
            return -ENOTCONN;
    }
    return complete("discover_descriptors", dev,
                    Event::response(dev, ResponseKind::DescriptorsDiscovered, characteristic));
}

std::vector<NativeService> FakeAdapter::services(const DeviceId &dev) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = devices_.find(dev);
    if (it == devices_.end() || !it->second.discovered)
        return {};
    const Device &d = it->second;
    if (d.filter.empty())
        return d.tree;

    std::vector<NativeService> out;
    for (const auto &svc : d.tree)
    {
        if (std::find(d.filter.begin(), d.filter.end(), lower(svc.uuid)) != d.filter.end())
            out.push_back(svc);
    }
    return out;
}

int FakeAdapter::read_characteristic(const DeviceId &dev, const Handle &h)
{
    Event e = Event::value_updated(dev, h, {});
    {
        std::lock_guard<std::mutex> lk(mu_);
        note_call("read_characteristic");
        if (!devices_[dev].linked)
            return -ENOTCONN;
        auto it = char_values_.find(h);
        if (it != char_values_.end())
            e.bytes = it->second;
    }
    return complete("read_characteristic", dev, std::move(e));
}

int FakeAdapter::write_characteristic(const DeviceId &dev,
                                      const Handle   &h,
                                      const Bytes    &data,
                                      WriteType       type)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        note_call(type == WriteType::WithResponse ? "write_characteristic"
                                                  : "write_without_response");
        if (!devices_[dev].linked)
            return -ENOTCONN;
        writes_[h].push_back(data);
        if (type == WriteType::WithoutResponse)
            return 0;
    }
    return complete("write_characteristic", dev,
                    Event::response(dev, ResponseKind::CharacteristicWritten, h));
}

int FakeAdapter::read_descriptor(const DeviceId &dev, const Handle &h)
{
    Event e = Event::response(dev, ResponseKind::DescriptorRead, h);
    {
        std::lock_guard<std::mutex> lk(mu_);
        note_call("read_descriptor");
        if (!devices_[dev].linked)
            return -ENOTCONN;
        auto it = desc_values_.find(h);
        if (it != desc_values_.end())
            e.value = it->second;
    }
    return complete("read_descriptor", dev, std::move(e));
}

int FakeAdapter::write_descriptor(const DeviceId &dev, const Handle &h, const Bytes &data)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        note_call("write_descriptor");
        if (!devices_[dev].linked)
            return -ENOTCONN;
        writes_[h].push_back(data);
    }
    return complete("write_descriptor", dev,
                    Event::response(dev, ResponseKind::DescriptorWritten, h));
}

int FakeAdapter::set_notify(const DeviceId &dev, const Handle &h, bool enabled)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        note_call(enabled ? "start_notify" : "stop_notify");
        if (!devices_[dev].linked)
            return -ENOTCONN;
        if (enabled)
            notifying_.insert(h);
        else
            notifying_.erase(h);
    }
    return complete(enabled ? "start_notify" : "stop_notify", dev,
                    Event::response(dev, ResponseKind::NotifyStateUpdated, h));
}

int FakeAdapter::read_rssi(const DeviceId &dev)
{
    Event e = Event::response(dev, ResponseKind::RssiRead);
    {
        std::lock_guard<std::mutex> lk(mu_);
        note_call("read_rssi");
        if (!devices_[dev].linked)
            return -ENOTCONN;
        e.rssi = rssi_;
    }
    return complete("read_rssi", dev, std::move(e));
}

bool FakeAdapter::can_send_write_without_response(const DeviceId &dev) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = devices_.find(dev);
    return it == devices_.end() || it->second.wwr_ready;
}

std::string FakeAdapter::name(const DeviceId &dev) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = devices_.find(dev);
    return it == devices_.end() ? std::string() : it->second.name;
}

}  // namespace adapter
