#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

#include "adapter/native_adapter.hpp"

namespace adapter
{

struct StreamCore;

// Single ordered fan-out of native events. publish() is serialized: every listener sees
// events in publish order. Callbacks run on the publishing thread and may publish again
// (nested events are delivered immediately).
class EventStream
{
  public:
    using Callback = std::function<void(const Event &)>;

    class Listener
    {
      public:
        Listener() = default;
        Listener(Listener &&o) noexcept;
        Listener &operator=(Listener &&o) noexcept;
        ~Listener();

        Listener(const Listener &)            = delete;
        Listener &operator=(const Listener &) = delete;

        // Detach. On return the callback is not running and will not run again, unless
        // reset() is called from inside that very callback.
        void reset();
        bool attached() const { return id_ != 0; }

      private:
        friend class EventStream;
        Listener(std::weak_ptr<StreamCore> core, std::uint64_t id)
            : core_(std::move(core)), id_(id)
        {
        }
        std::weak_ptr<StreamCore> core_;
        std::uint64_t                    id_ = 0;
    };

    EventStream();

    Listener listen(Callback cb);
    void     publish(const Event &e);

  private:
    std::shared_ptr<StreamCore> core_;
};

struct StreamCore
{
    std::recursive_mutex dispatch_mu;  // held for a whole publish()
    std::mutex           mu;           // guards listeners
    std::uint64_t        next_id = 1;
    std::map<std::uint64_t, std::shared_ptr<EventStream::Callback>> listeners;
};

}  // namespace adapter
