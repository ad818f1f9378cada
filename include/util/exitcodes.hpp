#pragma once

#include "util/errors.hpp"

namespace exitc
{
constexpr int ok        = 0;
constexpr int fail      = 1;
constexpr int bad_args  = 2;
constexpr int io        = 3;
constexpr int timeout   = 4;
constexpr int integrity = 5;
constexpr int rejected  = 6;

inline int from_error(udpconv::Error e)
{
    using udpconv::Error;
    switch (e)
    {
        case Error::Ok:
            return ok;
        case Error::InvalidArgument:
            return bad_args;
        case Error::Io:
            return io;
        case Error::TransferTimeout:
            return timeout;
        case Error::IntegrityMismatch:
            return integrity;
        case Error::PeerRejected:
        case Error::Conversion:
            return rejected;
        default:
            return fail;
    }
}
}  // namespace exitc
