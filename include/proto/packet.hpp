#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "util/errors.hpp"

/*
Wire unit (big-endian):

  offset 0   type     1B
  offset 1   seq      4B
  offset 5   total    4B
  offset 9.. payload  0..1024B

TX: Packet -> encode() -> transport.send_to()
RX: transport on_rx -> decode() -> engine.on_packet()
*/

namespace proto
{

inline constexpr std::size_t HDR_SIZE    = 9;
inline constexpr std::size_t MAX_PAYLOAD = 1024;
inline constexpr std::size_t MAX_PACKET  = HDR_SIZE + MAX_PAYLOAD;

enum class PacketType : std::uint8_t
{
    Command  = 0x01,
    Metadata = 0x02,
    Data     = 0x03,
    Hash     = 0x04,
    Ack      = 0x05,
    Nack     = 0x06,
    Ok       = 0x07,
    Error    = 0x08,
    Complete = 0x09
};

struct Packet
{
    PacketType                type{PacketType::Command};
    std::uint32_t             seq{0};
    std::uint32_t             total{0};
    std::vector<std::uint8_t> payload;

    bool operator==(const Packet &o) const
    {
        return type == o.type && seq == o.seq && total == o.total && payload == o.payload;
    }
    bool operator!=(const Packet &o) const { return !(*this == o); }
};

bool        is_known_type(std::uint8_t code);
const char *type_name(PacketType t);

// Returns an empty vector if the packet can not be put on the wire.
std::vector<std::uint8_t> encode(const Packet &p);
std::optional<Packet>     decode(const std::vector<std::uint8_t> &frame,
                                 udpconv::Error                  *err = nullptr);
std::optional<Packet>     decode(const std::uint8_t *data, std::size_t len,
                                 udpconv::Error *err = nullptr);

bool pack_header(const Packet &in, std::uint8_t out[HDR_SIZE]);
bool unpack_header(const std::uint8_t in[HDR_SIZE], Packet &out);

Packet make_packet(PacketType t, std::uint32_t seq, std::uint32_t total,
                   std::vector<std::uint8_t> payload = {});

}  // namespace proto
