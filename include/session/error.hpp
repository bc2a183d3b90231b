#pragma once
#include <optional>
#include <string>

#include "session/state.hpp"

namespace session
{

enum class Errc
{
    Ok = 0,
    AdapterDisabled,     // connect() precondition: adapter not powered on
    AdapterUnavailable,  // adapter left the powered-on state while connecting
    ConnectionLost,      // link dropped during an attempt or operation
    NotReady,            // no live connection (or no catalog) for the operation
    IOFailure,           // native stack reported an error for the command
    CapabilityMissing,   // target found but lacks the required property
    NotFound,            // no matching service / characteristic / descriptor
    Cancelled            // caller stopped waiting; not a link failure
};

const char *to_string(Errc e);

struct Status
{
    Errc                            code = Errc::Ok;
    std::optional<DisconnectStatus> reason{};  // ConnectionLost only
    int                             native_code = 0;
    std::string                     message;

    bool     ok() const noexcept { return code == Errc::Ok; }
    explicit operator bool() const noexcept { return ok(); }

    static Status success() { return Status{}; }
    static Status error(Errc c, std::string msg)
    {
        Status s;
        s.code    = c;
        s.message = std::move(msg);
        return s;
    }
    static Status io_failure(int native, std::string msg)
    {
        Status s      = error(Errc::IOFailure, std::move(msg));
        s.native_code = native;
        return s;
    }
    static Status connection_lost(std::optional<DisconnectStatus> why, std::string msg)
    {
        Status s      = error(Errc::ConnectionLost, std::move(msg));
        s.reason      = why;
        s.native_code = why ? why->code : 0;
        return s;
    }
    static Status cancelled() { return error(Errc::Cancelled, "cancelled"); }
};

// "IOFailure: WriteValue failed (native=-5)"
std::string to_string(const Status &s);

}  // namespace session
