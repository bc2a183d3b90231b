#include "session/error.hpp"

namespace session
{

const char *to_string(Errc e)
{
    switch (e)
    {
        case Errc::Ok:
            return "Ok";
        case Errc::AdapterDisabled:
            return "AdapterDisabled";
        case Errc::AdapterUnavailable:
            return "AdapterUnavailable";
        case Errc::ConnectionLost:
            return "ConnectionLost";
        case Errc::NotReady:
            return "NotReady";
        case Errc::IOFailure:
            return "IOFailure";
        case Errc::CapabilityMissing:
            return "CapabilityMissing";
        case Errc::NotFound:
            return "NotFound";
        case Errc::Cancelled:
            return "Cancelled";
    }
    return "?";
}

std::string to_string(const Status &s)
{
    std::string out = to_string(s.code);
    if (!s.message.empty())
        out += ": " + s.message;
    if (s.reason)
        out += " [" + to_string(*s.reason) + "]";
    else if (s.native_code != 0)
        out += " (native=" + std::to_string(s.native_code) + ")";
    return out;
}

}  // namespace session
