#include <arpa/inet.h>  // htonl, ntohl
#include <cstdint>
#include <cstring>

#include "proto/packet.hpp"
#include "util/log.hpp"

namespace proto
{

bool is_known_type(std::uint8_t code)
{
    return code >= static_cast<std::uint8_t>(PacketType::Command) &&
           code <= static_cast<std::uint8_t>(PacketType::Complete);
}

const char *type_name(PacketType t)
{
    switch (t)
    {
        case PacketType::Command:
            return "COMMAND";
        case PacketType::Metadata:
            return "METADATA";
        case PacketType::Data:
            return "DATA";
        case PacketType::Hash:
            return "HASH";
        case PacketType::Ack:
            return "ACK";
        case PacketType::Nack:
            return "NACK";
        case PacketType::Ok:
            return "OK";
        case PacketType::Error:
            return "ERROR";
        case PacketType::Complete:
            return "COMPLETE";
    }
    return "?";
}

Packet make_packet(PacketType t, std::uint32_t seq, std::uint32_t total,
                   std::vector<std::uint8_t> payload)
{
    Packet p;
    p.type    = t;
    p.seq     = seq;
    p.total   = total;
    p.payload = std::move(payload);
    return p;
}

bool pack_header(const Packet &in, std::uint8_t out[HDR_SIZE])
{
    // validate fields before packing
    if (!is_known_type(static_cast<std::uint8_t>(in.type)))
        return false;
    if (in.type == PacketType::Data && in.total > 0 && in.seq >= in.total)
        return false;

    out[0] = static_cast<std::uint8_t>(in.type);

    std::uint32_t seq_be = htonl(in.seq);
    std::memcpy(out + 1, &seq_be, sizeof seq_be);

    std::uint32_t total_be = htonl(in.total);
    std::memcpy(out + 5, &total_be, sizeof total_be);

    return true;
}

bool unpack_header(const std::uint8_t in[HDR_SIZE], Packet &out)
{
    if (!is_known_type(in[0]))
        return false;
    out.type = static_cast<PacketType>(in[0]);

    std::uint32_t seq_be;
    std::memcpy(&seq_be, in + 1, sizeof seq_be);
    out.seq = ntohl(seq_be);

    std::uint32_t total_be;
    std::memcpy(&total_be, in + 5, sizeof total_be);
    out.total = ntohl(total_be);

    return true;
}

std::vector<std::uint8_t> encode(const Packet &p)
{
    if (p.payload.size() > MAX_PAYLOAD)
    {
        LOG_ERROR("encode: payload too large (%zu > %zu)", p.payload.size(), MAX_PAYLOAD);
        return {};
    }

    std::vector<std::uint8_t> out(HDR_SIZE + p.payload.size());
    if (!pack_header(p, out.data()))
    {
        LOG_ERROR("encode: invalid header (type=0x%02x seq=%u total=%u)",
                  static_cast<unsigned>(p.type), p.seq, p.total);
        return {};
    }

    if (!p.payload.empty())
        std::memcpy(out.data() + HDR_SIZE, p.payload.data(), p.payload.size());
    return out;
}

std::optional<Packet> decode(const std::uint8_t *data, std::size_t len, udpconv::Error *err)
{
    using udpconv::Error;
    if (!data || len < HDR_SIZE)
    {
        LOG_DEBUG("decode: frame too short (%zu)", len);
        udpconv::set_error(err, Error::Decode);
        return std::nullopt;
    }
    if (len - HDR_SIZE > MAX_PAYLOAD)
    {
        LOG_DEBUG("decode: payload too large (%zu)", len - HDR_SIZE);
        udpconv::set_error(err, Error::Decode);
        return std::nullopt;
    }

    Packet p;
    if (!unpack_header(data, p))
    {
        LOG_DEBUG("decode: unknown packet type 0x%02x", static_cast<unsigned>(data[0]));
        udpconv::set_error(err, Error::Decode);
        return std::nullopt;
    }
    if (len > HDR_SIZE)
        p.payload.assign(data + HDR_SIZE, data + len);

    udpconv::set_error(err, Error::Ok);
    return p;
}

std::optional<Packet> decode(const std::vector<std::uint8_t> &frame, udpconv::Error *err)
{
    return decode(frame.data(), frame.size(), err);
}

}  // namespace proto
