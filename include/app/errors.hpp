#pragma once
#include <functional>
#include <optional>
#include <string>

namespace app
{

enum class Errc
{
    NotConnected,
    UnexpectedIdentity,
    DiscoveryFailure,
    TransportWrite,
    TransportRead,
    Decode,
    RemoteCompile,
    InvalidArgument
};

struct Error
{
    Errc        code;
    std::string message;
};

// nullopt == success. Every command invokes its callback exactly once.
using WriteCallback = std::function<void(const std::optional<Error> &)>;
using ReadCallback  = std::function<void(const std::optional<Error> &, const std::string &)>;

inline const char *errc_name(Errc c)
{
    switch (c)
    {
        case Errc::NotConnected:
            return "not-connected";
        case Errc::UnexpectedIdentity:
            return "unexpected-identity";
        case Errc::DiscoveryFailure:
            return "discovery-failure";
        case Errc::TransportWrite:
            return "transport-write";
        case Errc::TransportRead:
            return "transport-read";
        case Errc::Decode:
            return "decode";
        case Errc::RemoteCompile:
            return "remote-compile";
        case Errc::InvalidArgument:
            return "invalid-argument";
    }
    return "?";
}

inline std::string describe(const std::optional<Error> &e)
{
    if (!e)
        return "ok";
    return std::string(errc_name(e->code)) + ": " + e->message;
}

}  // namespace app
