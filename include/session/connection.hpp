#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "adapter/event_stream.hpp"
#include "adapter/native_adapter.hpp"
#include "session/error.hpp"
#include "util/cancel.hpp"
#include "util/signal.hpp"

/*
Connection: one live link and its operation serializer.

  caller A ──┐
  caller B ──┼─ guard (one at a time) ─> native command ─> wait for the next event of `kind`
  caller C ──┘                                                   │
                                                                 v
  adapter events ──> correlation table [kind -> pending] ──> fulfil / IOFailure
                 └─> Disconnected / ConnectFailed ──> close(): every waiter gets ConnectionLost

A waiter that is cancelled stops waiting; the native command is not cancelled and its late
completion finds no pending entry.
*/

namespace session
{

// Mutual exclusion granted in arrival order. A waiter cancelled while queued leaves the line.
class Guard
{
  public:
    bool acquire(const gattlink::CancelToken &tok);
    void release();

  private:
    std::mutex                mu_;
    std::condition_variable   cv_;
    bool                      busy_        = false;
    std::uint64_t             next_ticket_ = 1;
    std::deque<std::uint64_t> line_;
};

class Connection
{
  public:
    using NativeCall = std::function<int()>;

    Connection(adapter::NativeAdapter &adapter, adapter::DeviceId device);
    ~Connection();

    Connection(const Connection &)            = delete;
    Connection &operator=(const Connection &) = delete;

    // Issue `call` and wait for the next Response of `kind` for this device.
    Status execute(adapter::ResponseKind        kind,
                   const NativeCall            &call,
                   adapter::Event              *out,
                   const gattlink::CancelToken &tok);

    // Characteristic reads complete through the value-update channel: wait for the first
    // ValueUpdated addressed to `handle`.
    Status read_value(const adapter::Handle       &handle,
                      const NativeCall            &call,
                      adapter::Bytes              &out,
                      const gattlink::CancelToken &tok);

    // Waits for write-without-response readiness, then issues `call`; no completion awaited.
    Status write_without_response(const NativeCall &call, const gattlink::CancelToken &tok);

    // Fails every waiter and every later operation with `why`. Idempotent.
    void   close(const Status &why);
    bool   closed() const;
    Status close_status() const;

    const adapter::DeviceId &device() const { return device_; }

  private:
    struct Pending
    {
        bool           done = false;
        adapter::Event event;
    };

    class GuardLock;

    void   on_event(const adapter::Event &e);
    Status await(const std::shared_ptr<Pending> &p, const gattlink::CancelToken &tok);

    adapter::NativeAdapter &adapter_;
    adapter::DeviceId       device_;
    Guard                   guard_;

    mutable std::mutex                                                   table_mu_;
    std::condition_variable                                              table_cv_;
    std::unordered_map<adapter::ResponseKind, std::shared_ptr<Pending>> pending_;
    std::shared_ptr<Pending>                                             value_pending_;
    adapter::Handle                                                      value_handle_;
    bool                                                                 closed_ = false;
    Status                                                               close_status_;

    gattlink::CancelSource  closed_source_;
    gattlink::Signal<bool>  write_ready_;
    adapter::EventStream::Listener events_;  // last: detached first on destruction
};

}  // namespace session
