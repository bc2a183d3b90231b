#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "adapter/event_stream.hpp"
#include "adapter/native_adapter.hpp"

namespace adapter
{

// FakeAdapter: an in-process native stack to exercise the session without a radio.
// Completions are published on the calling thread, or from a worker thread in order when a
// response delay is set. Faults are one-shot per command name ("connect", "read_rssi", ...).
class FakeAdapter final : public NativeAdapter
{
  public:
    enum class Fault
    {
        Error,      // complete with a native error (ConnectFailed for "connect")
        Drop,       // never complete
        Disconnect  // drop the link instead of completing
    };

    FakeAdapter();
    ~FakeAdapter() override;

    // ---- scripting ----
    void set_services(const DeviceId &dev, std::vector<NativeService> tree);
    void set_device_name(const DeviceId &dev, std::string name);
    void set_power_state(PowerState s);  // publishes PowerStateChanged
    void set_mtu(int mtu);
    void set_rssi(int rssi);
    void set_characteristic_value(const Handle &h, Bytes v);
    void set_descriptor_value(const Handle &h, NativeValue v);
    void set_write_ready(const DeviceId &dev, bool ready);  // true also publishes the event
    void set_response_delay(std::chrono::milliseconds d);
    void inject(const std::string &command, Fault f, int code = 0);
    void emit_value(const DeviceId &dev, const Handle &h, Bytes v);
    void drop_link(const DeviceId &dev, int code);

    // ---- inspection ----
    int                      calls(const std::string &command) const;
    std::vector<std::string> call_log() const;
    int                      max_inflight() const;
    bool                     notifying(const Handle &h) const;
    std::vector<Bytes>       writes(const Handle &h) const;
    bool                     linked(const DeviceId &dev) const;

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
    struct Device
    {
        std::vector<NativeService> tree;
        std::vector<std::string>   filter;
        std::string                name;
        bool                       linked     = false;
        bool                       pending    = false;  // connect submitted, not completed
        bool                       discovered = false;
        bool                       wwr_ready  = true;
    };

    struct Injected
    {
        Fault fault;
        int   code;
    };

    struct Delivery
    {
        Event                                 event;
        bool                                  completes;  // counted in-flight
        std::chrono::steady_clock::time_point due;
    };

    // under mu_
    void note_call(const std::string &cmd);
    bool take_fault(const std::string &cmd, Injected &out);
    void start_op();

    // outside mu_
    void deliver(Event e, bool completes);
    int  complete(const std::string &cmd, const DeviceId &dev, Event ok_event);
    void worker_loop();

    EventStream events_;

    mutable std::mutex                              mu_;
    PowerState                                      power_ = PowerState::PoweredOn;
    std::map<DeviceId, Device>                      devices_;
    std::map<Handle, Bytes>                         char_values_;
    std::map<Handle, NativeValue>                   desc_values_;
    std::map<Handle, std::vector<Bytes>>            writes_;
    std::set<Handle>                                notifying_;
    std::map<std::string, std::deque<Injected>>     faults_;
    std::vector<std::string>                        log_;
    int                                             mtu_          = 185;
    int                                             rssi_         = -60;
    int                                             inflight_     = 0;
    int                                             max_inflight_ = 0;
    std::chrono::milliseconds                       delay_{0};

    // delayed delivery
    std::condition_variable                         cv_;
    std::deque<Delivery>                            queue_;
    bool                                            stop_ = false;
    std::thread                                     worker_;
};

}  // namespace adapter
