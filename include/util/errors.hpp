#pragma once

namespace udpconv
{

// Failure classes of one transfer. Only TransferTimeout, IntegrityMismatch, PeerRejected and
// Conversion are reported to the end user; the rest are dropped and logged.
enum class Error
{
    Ok = 0,
    Decode,             // malformed datagram
    OutOfRange,         // sequence id outside the declared total
    Incomplete,         // assemble() before every chunk arrived
    TransferTimeout,    // retry budget or idle window exhausted
    IntegrityMismatch,  // digest or length differs after reassembly
    ProtocolViolation,  // packet type not valid in the current state
    PeerRejected,       // peer answered NACK or ERROR
    Conversion,         // transform collaborator failed
    InvalidArgument,
    Io
};

inline const char *error_name(Error e)
{
    switch (e)
    {
        case Error::Ok:
            return "ok";
        case Error::Decode:
            return "decode_error";
        case Error::OutOfRange:
            return "out_of_range";
        case Error::Incomplete:
            return "incomplete";
        case Error::TransferTimeout:
            return "transfer_timeout";
        case Error::IntegrityMismatch:
            return "integrity_mismatch";
        case Error::ProtocolViolation:
            return "protocol_violation";
        case Error::PeerRejected:
            return "peer_rejected";
        case Error::Conversion:
            return "conversion_error";
        case Error::InvalidArgument:
            return "invalid_argument";
        case Error::Io:
            return "io_error";
    }
    return "?";
}

inline void set_error(Error *out, Error e)
{
    if (out)
        *out = e;
}

}  // namespace udpconv
