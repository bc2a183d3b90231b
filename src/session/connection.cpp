#include <algorithm>
#include <cstring>

#include "session/connection.hpp"
#include "util/log.hpp"

namespace session
{

// ====== Guard ======

bool Guard::acquire(const gattlink::CancelToken &tok)
{
    bool                         cancelled = false;
    gattlink::CancelRegistration reg(tok, [this, &cancelled] {
        std::lock_guard<std::mutex> lk(mu_);
        cancelled = true;
        cv_.notify_all();
    });
    std::unique_lock<std::mutex> lk(mu_);
    const std::uint64_t          ticket = next_ticket_++;
    line_.push_back(ticket);
    cv_.wait(lk, [&] { return (!busy_ && line_.front() == ticket) || cancelled; });
    if (cancelled)
    {
        line_.erase(std::find(line_.begin(), line_.end(), ticket));
        lk.unlock();
        cv_.notify_all();  // the next in line may be free to go
        return false;
    }
    line_.pop_front();
    busy_ = true;
    return true;
}

void Guard::release()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        busy_ = false;
    }
    cv_.notify_all();
}

class Connection::GuardLock
{
  public:
    GuardLock(Guard &g, const gattlink::CancelToken &tok) : g_(g), owns_(g.acquire(tok)) {}
    ~GuardLock()
    {
        if (owns_)
            g_.release();
    }
    bool owns() const { return owns_; }

  private:
    Guard &g_;
    bool   owns_;
};

// ====== Connection ======

Connection::Connection(adapter::NativeAdapter &adapter, adapter::DeviceId device)
    : adapter_(adapter),
      device_(std::move(device)),
      write_ready_(adapter.can_send_write_without_response(device_))
{
    events_ = adapter_.events().listen([this](const adapter::Event &e) {
        if (e.device == device_)
            on_event(e);
    });
}

Connection::~Connection()
{
    events_.reset();
    close(Status::error(Errc::NotReady, "Connection disposed"));
}

void Connection::on_event(const adapter::Event &e)
{
    using Type = adapter::Event::Type;
    switch (e.type)
    {
        case Type::Response:
        {
            {
                std::lock_guard<std::mutex> lk(table_mu_);
                auto                        it = pending_.find(e.kind);
                if (it == pending_.end() || it->second->done)
                {
                    LOG_DEBUG("[GUARD] %s: unclaimed %s", device_.c_str(), adapter::to_string(e.kind));
                    return;
                }
                it->second->done  = true;
                it->second->event = e;
            }
            table_cv_.notify_all();
            return;
        }
        case Type::ValueUpdated:
        {
            {
                std::lock_guard<std::mutex> lk(table_mu_);
                if (!value_pending_ || value_pending_->done || value_handle_ != e.handle)
                    return;
                value_pending_->done  = true;
                value_pending_->event = e;
            }
            table_cv_.notify_all();
            return;
        }
        case Type::Disconnected:
        case Type::ConnectFailed:
            close(Status::connection_lost(decode_disconnect_code(e.code),
                                          device_ + " disconnected"));
            return;
        case Type::WriteWithoutResponseReady:
            write_ready_.set(true);
            return;
        case Type::Connected:
        case Type::PowerStateChanged:
            return;
    }
}

Status Connection::await(const std::shared_ptr<Pending> &p, const gattlink::CancelToken &tok)
{
    bool                         cancelled = false;
    gattlink::CancelRegistration reg(tok, [this, &cancelled] {
        std::lock_guard<std::mutex> lk(table_mu_);
        cancelled = true;
        table_cv_.notify_all();
    });
    std::unique_lock<std::mutex> lk(table_mu_);
    table_cv_.wait(lk, [&] { return p->done || closed_ || cancelled; });

    if (p->done)
    {
        if (p->event.error)
            return Status::io_failure(p->event.error->code, p->event.error->message);
        return Status::success();
    }
    if (closed_)
        return close_status_;
    return Status::cancelled();
}

// ====== Function: execute
// - In: expected response kind, native command, caller token
// - Out: the correlated Response event in `*out` (optional)
// - Note: the guard is held from submission until the response (or failure), so responses of
//         the same kind can never be handed to the wrong caller.
Status Connection::execute(adapter::ResponseKind        kind,
                           const NativeCall            &call,
                           adapter::Event              *out,
                           const gattlink::CancelToken &tok)
{
    GuardLock g(guard_, tok);
    if (!g.owns())
        return Status::cancelled();

    auto p = std::make_shared<Pending>();
    {
        std::lock_guard<std::mutex> lk(table_mu_);
        if (closed_)
            return close_status_;
        pending_[kind] = p;
    }

    LOG_DEBUG("[GUARD] %s: -> %s", device_.c_str(), adapter::to_string(kind));
    const int r  = call();
    Status    st = r < 0 ? Status::io_failure(r, std::string("Native command failed: ") +
                                                     std::strerror(-r))
                         : await(p, tok);
    {
        std::lock_guard<std::mutex> lk(table_mu_);
        auto                        it = pending_.find(kind);
        if (it != pending_.end() && it->second == p)
            pending_.erase(it);
    }

    if (!st)
    {
        LOG_DEBUG("[GUARD] %s: %s failed: %s", device_.c_str(), adapter::to_string(kind),
                  to_string(st).c_str());
        return st;
    }
    if (out)
        *out = p->event;
    return st;
}

Status Connection::read_value(const adapter::Handle       &handle,
                              const NativeCall            &call,
                              adapter::Bytes              &out,
                              const gattlink::CancelToken &tok)
{
    GuardLock g(guard_, tok);
    if (!g.owns())
        return Status::cancelled();

    auto p = std::make_shared<Pending>();
    {
        std::lock_guard<std::mutex> lk(table_mu_);
        if (closed_)
            return close_status_;
        value_pending_ = p;
        value_handle_  = handle;
    }

    LOG_DEBUG("[GUARD] %s: -> read %s", device_.c_str(), handle.c_str());
    const int r  = call();
    Status    st = r < 0 ? Status::io_failure(r, std::string("Native read failed: ") +
                                                     std::strerror(-r))
                         : await(p, tok);
    {
        std::lock_guard<std::mutex> lk(table_mu_);
        if (value_pending_ == p)
        {
            value_pending_.reset();
            value_handle_.clear();
        }
    }

    if (st)
        out = p->event.bytes;
    return st;
}

// ====== Function: write_without_response
// - In: native write command, caller token
// - Note: readiness is re-sampled from the stack under the guard; when not ready we wait for
//         WriteWithoutResponseReady. Two unacknowledged writes never pass the check together.
Status Connection::write_without_response(const NativeCall &call, const gattlink::CancelToken &tok)
{
    GuardLock g(guard_, tok);
    if (!g.owns())
        return Status::cancelled();
    if (closed())
        return close_status();

    const bool ready = adapter_.can_send_write_without_response(device_);
    write_ready_.set(ready);
    if (!ready)
    {
        LOG_DEBUG("[GUARD] %s: waiting for write-without-response readiness", device_.c_str());
        gattlink::LinkedCancel wait{tok, closed_source_.token()};
        if (!write_ready_.wait_until([](bool v) { return v; }, wait.token()))
            return closed() ? close_status() : Status::cancelled();
    }

    const int r = call();
    if (r < 0)
        return Status::io_failure(r, std::string("Native write failed: ") + std::strerror(-r));
    return Status::success();
}

void Connection::close(const Status &why)
{
    {
        std::lock_guard<std::mutex> lk(table_mu_);
        if (closed_)
            return;
        closed_       = true;
        close_status_ = why;
    }
    table_cv_.notify_all();
    closed_source_.cancel();
    LOG_DEBUG("[GUARD] %s: closed (%s)", device_.c_str(), to_string(why).c_str());
}

bool Connection::closed() const
{
    std::lock_guard<std::mutex> lk(table_mu_);
    return closed_;
}

Status Connection::close_status() const
{
    std::lock_guard<std::mutex> lk(table_mu_);
    return close_status_;
}

}  // namespace session
