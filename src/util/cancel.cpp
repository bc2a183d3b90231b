#include "util/cancel.hpp"

namespace gattlink
{

bool CancelToken::cancelled() const
{
    if (!state_)
        return false;
    std::lock_guard<std::mutex> lk(state_->mu);
    return state_->cancelled;
}

CancelSource::CancelSource() : state_(std::make_shared<detail::CancelState>()) {}

void CancelSource::cancel()
{
    std::lock_guard<std::mutex> lk(state_->mu);
    if (state_->cancelled)
        return;
    state_->cancelled = true;
    // Run under the lock so a registration being dropped on another thread waits for us.
    for (auto &kv : state_->callbacks)
    {
        if (kv.second)
            kv.second();
    }
    state_->callbacks.clear();
}

bool CancelSource::cancelled() const
{
    std::lock_guard<std::mutex> lk(state_->mu);
    return state_->cancelled;
}

CancelRegistration::CancelRegistration(const CancelToken &tok, std::function<void()> fn)
    : state_(tok.state_)
{
    if (!state_ || !fn)
        return;
    std::lock_guard<std::mutex> lk(state_->mu);
    if (state_->cancelled)
    {
        fn();
        return;
    }
    id_ = state_->next_id++;
    state_->callbacks.emplace(id_, std::move(fn));
}

CancelRegistration::~CancelRegistration()
{
    if (!state_ || id_ == 0)
        return;
    std::lock_guard<std::mutex> lk(state_->mu);
    state_->callbacks.erase(id_);
}

LinkedCancel::LinkedCancel(std::initializer_list<CancelToken> parents)
{
    for (const auto &p : parents)
    {
        if (!p.can_cancel())
            continue;
        // Parent lock is always taken before ours, never the other way around.
        links_.push_back(
            std::make_unique<CancelRegistration>(p, [this] { source_.cancel(); }));
    }
}

}  // namespace gattlink
