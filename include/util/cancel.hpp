#pragma once
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

/*
Cancellation model:

  CancelSource  --token()-->  CancelToken (cheap copy, passed into every blocking call)
                                   |
                                   +-- CancelRegistration(token, fn): fn runs once on cancel
                                       (or immediately if already cancelled), detached on scope exit

A default-constructed CancelToken is never cancelled. Teardown paths (native disconnect,
disposal) never take the caller's token, so they run even when the caller gave up.
*/

namespace gattlink
{

namespace detail
{
struct CancelState
{
    std::mutex                                      mu;
    bool                                            cancelled = false;
    std::uint64_t                                   next_id   = 1;
    std::map<std::uint64_t, std::function<void()>> callbacks;
};
}  // namespace detail

class CancelToken
{
  public:
    CancelToken() = default;

    bool cancelled() const;
    bool can_cancel() const noexcept { return static_cast<bool>(state_); }

  private:
    friend class CancelSource;
    friend class CancelRegistration;
    explicit CancelToken(std::shared_ptr<detail::CancelState> s) : state_(std::move(s)) {}

    std::shared_ptr<detail::CancelState> state_;
};

class CancelSource
{
  public:
    CancelSource();

    // Idempotent. Callbacks run on the cancelling thread, under the token lock:
    // they must not register or drop registrations on the same token.
    void        cancel();
    bool        cancelled() const;
    CancelToken token() const { return CancelToken(state_); }

  private:
    std::shared_ptr<detail::CancelState> state_;
};

class CancelRegistration
{
  public:
    CancelRegistration(const CancelToken &tok, std::function<void()> fn);
    ~CancelRegistration();

    CancelRegistration(const CancelRegistration &)            = delete;
    CancelRegistration &operator=(const CancelRegistration &) = delete;

  private:
    std::shared_ptr<detail::CancelState> state_;
    std::uint64_t                        id_ = 0;
};

// A source that is cancelled when any of its parents is, or when cancel() is called directly.
class LinkedCancel
{
  public:
    LinkedCancel(std::initializer_list<CancelToken> parents);

    LinkedCancel(const LinkedCancel &)            = delete;
    LinkedCancel &operator=(const LinkedCancel &) = delete;

    void        cancel() { source_.cancel(); }
    bool        cancelled() const { return source_.cancelled(); }
    CancelToken token() const { return source_.token(); }

  private:
    CancelSource                                     source_;
    std::vector<std::unique_ptr<CancelRegistration>> links_;
};

}  // namespace gattlink
