#include "proto/reassembly.hpp"
#include "proto/packet.hpp"
#include "util/log.hpp"

namespace proto
{
using udpconv::Error;

bool Reassembler::reset(std::uint32_t total)
{
    const bool fits = total <= MAX_CHUNKS;
    if (!fits)
    {
        LOG_WARN("Reassembler::reset: %u chunks exceeds the limit of %u", total, MAX_CHUNKS);
        total = 0;
    }
    total_    = total;
    received_ = 0;
    bytes_    = 0;
    parts_.assign(total, {});
    have_.assign(total, false);
    return fits;
}

Error Reassembler::accept(std::uint32_t seq, std::uint32_t total,
                          const std::vector<std::uint8_t> &payload)
{
    if (total == 0 || seq >= total || payload.size() > MAX_PAYLOAD)
    {
        LOG_DEBUG("Reassembler::accept: out of range (seq=%u total=%u len=%zu)", seq, total,
                  payload.size());
        return Error::OutOfRange;
    }
    if (total_ == 0)
    {
        LOG_DEBUG("Reassembler::accept: buffer not opened (seq=%u total=%u)", seq, total);
        return Error::OutOfRange;
    }
    if (total != total_)
    {
        LOG_DEBUG("Reassembler::accept: total changed (%u != %u)", total, total_);
        return Error::ProtocolViolation;
    }

    if (!have_[seq])
    {
        have_[seq] = true;
        received_++;
    }
    else
    {
        LOG_DEBUG("Reassembler::accept: duplicate chunk (seq=%u)", seq);
        bytes_ -= parts_[seq].size();
    }
    // last write wins
    parts_[seq] = payload;
    bytes_ += payload.size();
    return Error::Ok;
}

std::optional<std::vector<std::uint8_t>> Reassembler::assemble(Error *err) const
{
    if (!is_complete())
    {
        udpconv::set_error(err, Error::Incomplete);
        return std::nullopt;
    }

    std::vector<std::uint8_t> out;
    out.reserve(bytes_);
    for (const auto &part : parts_)
    {
        if (!part.empty())
            out.insert(out.end(), part.begin(), part.end());
    }
    udpconv::set_error(err, Error::Ok);
    return out;
}

}  // namespace proto
