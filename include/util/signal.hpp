#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

#include "util/cancel.hpp"

namespace gattlink
{

// Latest-value cell with change listeners. listen() replays the current value first, so a
// listener never misses the state it attached in. Used for connection state and for
// write-without-response readiness.
template <typename T>
class Signal
{
  public:
    using Callback = std::function<void(const T &)>;

    class Listener
    {
      public:
        Listener() = default;
        Listener(Listener &&o) noexcept : owner_(std::move(o.owner_)), id_(o.id_) { o.id_ = 0; }
        Listener &operator=(Listener &&o) noexcept
        {
            if (this != &o)
            {
                reset();
                owner_ = std::move(o.owner_);
                id_    = o.id_;
                o.id_  = 0;
            }
            return *this;
        }
        ~Listener() { reset(); }

        // Must not be called from inside this signal's callback.
        void reset()
        {
            if (auto core = owner_.lock())
            {
                std::lock_guard<std::mutex> lk(core->emit_mu);
                core->callbacks.erase(id_);
            }
            owner_.reset();
            id_ = 0;
        }

      private:
        friend class Signal;
        Listener(std::weak_ptr<typename Signal::Core> owner, std::uint64_t id)
            : owner_(std::move(owner)), id_(id)
        {
        }
        std::weak_ptr<typename Signal::Core> owner_;
        std::uint64_t                        id_ = 0;
    };

    explicit Signal(T initial) : core_(std::make_shared<Core>(std::move(initial))) {}

    T value() const
    {
        std::lock_guard<std::mutex> lk(core_->value_mu);
        return core_->value;
    }

    void set(T v)
    {
        update([&](const T &) { return v; });
    }

    // Read-modify-write; listeners see every resulting value in order.
    template <typename Fn>
    T update(Fn fn)
    {
        std::lock_guard<std::mutex> emit(core_->emit_mu);
        T                           next;
        {
            std::lock_guard<std::mutex> lk(core_->value_mu);
            next         = fn(static_cast<const T &>(core_->value));
            core_->value = next;
        }
        core_->cv.notify_all();
        for (auto &kv : core_->callbacks)
            kv.second(next);
        return next;
    }

    Listener listen(Callback cb)
    {
        std::lock_guard<std::mutex> emit(core_->emit_mu);
        const std::uint64_t         id = core_->next_id++;
        cb(value());
        core_->callbacks.emplace(id, std::move(cb));
        return Listener(core_, id);
    }

    // Blocks until pred(value) holds. Returns false when tok is cancelled first.
    template <typename Pred>
    bool wait_until(Pred pred, const CancelToken &tok, T *out = nullptr) const
    {
        // Never query the token while holding value_mu: cancel() holds the token lock when it
        // calls back into us.
        bool               cancelled = false;
        CancelRegistration reg(tok, [core = core_, &cancelled] {
            std::lock_guard<std::mutex> lk(core->value_mu);
            cancelled = true;
            core->cv.notify_all();
        });
        std::unique_lock<std::mutex> lk(core_->value_mu);
        core_->cv.wait(lk, [&] { return pred(core_->value) || cancelled; });
        if (!pred(core_->value))
            return false;
        if (out)
            *out = core_->value;
        return true;
    }

    // Bounded and not cancellable; false when pred still fails after timeout.
    template <typename Pred>
    bool wait_for(Pred pred, std::chrono::milliseconds timeout) const
    {
        std::unique_lock<std::mutex> lk(core_->value_mu);
        return core_->cv.wait_for(lk, timeout, [&] { return pred(core_->value); });
    }

  private:
    struct Core
    {
        explicit Core(T v) : value(std::move(v)) {}
        std::mutex                        emit_mu;   // serializes update() + listener fan-out
        mutable std::mutex                value_mu;  // guards value, paired with cv
        std::condition_variable           cv;
        T                                 value;
        std::uint64_t                     next_id = 1;
        std::map<std::uint64_t, Callback> callbacks;
    };

    std::shared_ptr<Core> core_;
};

}  // namespace gattlink
