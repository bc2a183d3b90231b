#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "adapter/native_adapter.hpp"
#include "gatt/catalog.hpp"
#include "session/error.hpp"
#include "util/cancel.hpp"

/*
Observation registry: one native notification per characteristic, shared by every subscriber.

  acquire(C1) ─┐                       first subscriber + connected: enable notify on C1
  acquire(C1) ─┼─> Observation(C1) ──> sinks: [s1, s2]
               │
  on_value(C1, bytes) ───────────────> every sink of C1 gets Value(bytes)
  on_disconnected() ─────────────────> every sink gets Disconnected
  on_connected()    ─────────────────> re-enable notify for every observation, run on_subscription
  ~Subscription()   ─────────────────> last subscriber gone: disable notify on C1

Nothing is kept for characteristics without subscribers; a new subscriber sees only later events.
*/

namespace gatt
{

struct ObservationEvent
{
    enum class Type
    {
        Value,
        Error,        // native error for this characteristic
        Disconnected  // link dropped; the subscription stays usable across reconnects
    };

    Type           type = Type::Value;
    adapter::Bytes value;
    int            code = 0;
    std::string    message;
};

// Native side of arming, provided by the session.
struct NotificationControl
{
    virtual session::Status enable_notifications(const CharacteristicRef   &ref,
                                                 const gattlink::CancelToken &tok)  = 0;
    virtual session::Status disable_notifications(const CharacteristicRef   &ref,
                                                  const gattlink::CancelToken &tok) = 0;
    // True while observations may be armed (configuring observations, or connected)
    virtual bool is_connected() const = 0;
    virtual ~NotificationControl()    = default;
};

// Runs every time the observation is armed, after notifications are enabled.
using OnSubscription = std::function<session::Status(const gattlink::CancelToken &)>;

// Decides what a failure to arm an observation during connect means. Returning an error fails
// the connect attempt; returning success ignores it.
using ObservationErrorHandler =
    std::function<session::Status(const CharacteristicRef &, const session::Status &)>;

struct ObservationSink;
class ObservationRegistry;

class Subscription
{
  public:
    ~Subscription();

    Subscription(const Subscription &)            = delete;
    Subscription &operator=(const Subscription &) = delete;

    // Blocks for the next event. Cancelled when tok fires, NotReady once the registry is shut down.
    session::Status next(ObservationEvent &out, const gattlink::CancelToken &tok);
    // false on timeout, or at once when the observation is closed and drained
    bool next_for(ObservationEvent &out, std::chrono::milliseconds timeout);

    const CharacteristicRef &characteristic() const { return ref_; }

  private:
    friend class ObservationRegistry;
    Subscription(std::weak_ptr<ObservationRegistry> owner,
                 CharacteristicRef                  ref,
                 std::uint64_t                      id,
                 std::shared_ptr<ObservationSink>   sink);

    std::weak_ptr<ObservationRegistry> owner_;
    CharacteristicRef                  ref_;
    std::uint64_t                      id_;
    std::shared_ptr<ObservationSink>   sink_;
};

class ObservationRegistry : public std::enable_shared_from_this<ObservationRegistry>
{
  public:
    ObservationRegistry(NotificationControl &ctl, ObservationErrorHandler on_error);

    session::Status acquire(const CharacteristicRef       &ref,
                            OnSubscription                 on_subscription,
                            std::unique_ptr<Subscription> &out,
                            const gattlink::CancelToken   &tok);

    // Re-arm every observation on a fresh connection.
    session::Status on_connected(const gattlink::CancelToken &tok);
    void            on_disconnected();
    void            on_value(const CharacteristicRef                 &ref,
                             const adapter::Bytes                    &value,
                             const std::optional<adapter::NativeError> &error);

    // Close every subscription; later calls are no-ops. Waits for an arm in progress.
    void shutdown();

    std::size_t observation_count() const;

  private:
    friend class Subscription;

    struct Subscriber
    {
        std::shared_ptr<ObservationSink> sink;
        OnSubscription                   on_subscription;
    };

    struct Observation
    {
        CharacteristicRef                    ref;
        std::map<std::uint64_t, Subscriber>  subscribers;
    };

    void release(const CharacteristicRef &ref, std::uint64_t id);
    // under mu_
    void broadcast(const Observation &obs, const ObservationEvent &ev);

    NotificationControl    &ctl_;
    ObservationErrorHandler on_error_;

    std::mutex                          arm_mu_;  // serializes native arming and disarming
    mutable std::mutex                  mu_;      // guards observations_
    std::map<std::string, Observation>  observations_;
    std::uint64_t                       next_id_ = 1;
    bool                                shut_    = false;
};

}  // namespace gatt
