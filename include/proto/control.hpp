#pragma once
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "proto/packet.hpp"

namespace proto
{
// METADATA TLV tags: [tag:1][len:2 BE][value]
constexpr std::uint8_t T_FILENAME = 0x01;
constexpr std::uint8_t T_LENGTH   = 0x02;  // 8B BE
constexpr std::uint8_t T_TOTAL    = 0x03;  // 4B BE
constexpr std::uint8_t T_MODE     = 0x04;

constexpr std::size_t FILENAME_MAX_LEN = 255;
constexpr std::size_t MODE_MAX_LEN     = 32;

struct Metadata
{
    std::string   filename;
    std::uint64_t byte_length{0};
    std::uint32_t total_count{0};
    std::string   mode;

    bool operator==(const Metadata &o) const
    {
        return filename == o.filename && byte_length == o.byte_length &&
               total_count == o.total_count && mode == o.mode;
    }
};

inline std::uint32_t chunks_for(std::uint64_t byte_length)
{
    return static_cast<std::uint32_t>((byte_length + MAX_PAYLOAD - 1) / MAX_PAYLOAD);
}

namespace detail
{
inline void put_tlv(std::vector<std::uint8_t> &out, std::uint8_t tag, const std::uint8_t *v,
                    std::size_t len)
{
    out.push_back(tag);
    out.push_back(static_cast<std::uint8_t>((len >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(len & 0xFF));
    out.insert(out.end(), v, v + len);
}

inline void put_be(std::vector<std::uint8_t> &out, std::uint64_t v, std::size_t width)
{
    for (std::size_t i = width; i-- > 0;)
        out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF));
}

inline std::uint64_t get_be(const std::uint8_t *v, std::size_t width)
{
    std::uint64_t x = 0;
    for (std::size_t i = 0; i < width; ++i)
        x = (x << 8) | v[i];
    return x;
}
}  // namespace detail

inline bool metadata_fits(const Metadata &m)
{
    return m.filename.size() <= FILENAME_MAX_LEN && m.mode.size() <= MODE_MAX_LEN;
}

// empty when the filename or mode is longer than parse_metadata accepts
inline std::vector<std::uint8_t> encode_metadata(const Metadata &m)
{
    std::vector<std::uint8_t> out;
    if (!metadata_fits(m))
        return out;
    const std::size_t name_len = m.filename.size();
    const std::size_t mode_len = m.mode.size();
    out.reserve(3 * 4 + name_len + 8 + 4 + mode_len);

    detail::put_tlv(out, T_FILENAME, reinterpret_cast<const std::uint8_t *>(m.filename.data()),
                    name_len);

    std::vector<std::uint8_t> num;
    detail::put_be(num, m.byte_length, 8);
    detail::put_tlv(out, T_LENGTH, num.data(), num.size());

    num.clear();
    detail::put_be(num, m.total_count, 4);
    detail::put_tlv(out, T_TOTAL, num.data(), num.size());

    detail::put_tlv(out, T_MODE, reinterpret_cast<const std::uint8_t *>(m.mode.data()), mode_len);
    return out;
}

// false on truncated records, bad field widths, or a missing length/total field
inline bool parse_metadata(const std::uint8_t *buf, std::size_t len, Metadata &m)
{
    bool        have_len = false, have_total = false;
    std::size_t i        = 0;
    while (i + 3 <= len)
    {
        std::uint8_t  t = buf[i++];
        std::uint16_t L = static_cast<std::uint16_t>(buf[i++] << 8);
        L |= buf[i++];
        if (i + L > len)
            return false;  // malformed => return false
        const std::uint8_t *v = buf + i;
        switch (t)
        {
            case T_FILENAME:
                if (L > FILENAME_MAX_LEN)
                    return false;
                m.filename.assign(reinterpret_cast<const char *>(v), L);
                break;
            case T_LENGTH:
                if (L != 8)
                    return false;
                m.byte_length = detail::get_be(v, 8);
                have_len      = true;
                break;
            case T_TOTAL:
                if (L != 4)
                    return false;
                m.total_count = static_cast<std::uint32_t>(detail::get_be(v, 4));
                have_total    = true;
                break;
            case T_MODE:
                if (L > MODE_MAX_LEN)
                    return false;
                m.mode.assign(reinterpret_cast<const char *>(v), L);
                break;
            default:  // ignore TLV if unknown
                break;
        }
        i += L;
    }
    return i == len && have_len && have_total;
}

// ACK/NACK: seq = acknowledged id, payload[0] = acknowledged type, NACK appends a reason
inline Packet make_ack(PacketType acked, std::uint32_t seq)
{
    return make_packet(PacketType::Ack, seq, 0, {static_cast<std::uint8_t>(acked)});
}

inline Packet make_nack(PacketType acked, std::uint32_t seq, std::string_view reason)
{
    std::vector<std::uint8_t> payload;
    payload.reserve(1 + reason.size());
    payload.push_back(static_cast<std::uint8_t>(acked));
    payload.insert(payload.end(), reason.begin(), reason.end());
    return make_packet(PacketType::Nack, seq, 0, std::move(payload));
}

inline std::optional<PacketType> acked_type(const Packet &p)
{
    if ((p.type != PacketType::Ack && p.type != PacketType::Nack) || p.payload.empty() ||
        !is_known_type(p.payload[0]))
        return std::nullopt;
    return static_cast<PacketType>(p.payload[0]);
}

inline std::string nack_reason(const Packet &p)
{
    if (p.type != PacketType::Nack || p.payload.size() < 2)
        return {};
    return std::string(p.payload.begin() + 1, p.payload.end());
}

inline Packet make_text(PacketType t, std::string_view text, std::uint32_t seq = 0)
{
    return make_packet(t, seq, 0, std::vector<std::uint8_t>(text.begin(), text.end()));
}

inline std::string payload_text(const Packet &p)
{
    return std::string(p.payload.begin(), p.payload.end());
}

// OK redirect: dedicated port as 2 bytes BE
inline Packet make_redirect(std::uint32_t nonce, std::uint16_t port)
{
    return make_packet(PacketType::Ok, nonce, 0,
                       {static_cast<std::uint8_t>(port >> 8), static_cast<std::uint8_t>(port)});
}

inline std::optional<std::uint16_t> parse_redirect(const Packet &p)
{
    if (p.type != PacketType::Ok || p.payload.size() != 2)
        return std::nullopt;
    std::uint16_t port = static_cast<std::uint16_t>((p.payload[0] << 8) | p.payload[1]);
    if (port == 0)
        return std::nullopt;
    return port;
}

// ERROR reasons
inline constexpr std::string_view R_INVALID_COMMAND    = "invalid_command";
inline constexpr std::string_view R_BAD_FORMAT         = "bad_command_format";
inline constexpr std::string_view R_UNSUPPORTED        = "unsupported_format";
inline constexpr std::string_view R_PROTOCOL_VIOLATION = "protocol_violation";
inline constexpr std::string_view R_CONVERSION_FAILED  = "conversion_failed";
inline constexpr std::string_view R_NO_RESOURCES       = "no_resources";

// "CONVERT <src> <dst> <filename>"
struct Command
{
    std::string src;
    std::string dst;
    std::string filename;

    std::string mode() const { return src + ":" + dst; }
};

inline std::string strip_dot(std::string s)
{
    while (!s.empty() && s.front() == '.')
        s.erase(s.begin());
    for (auto &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

inline std::string format_command(const Command &c)
{
    return "CONVERT " + strip_dot(c.src) + " " + strip_dot(c.dst) + " " + c.filename;
}

// On failure `reason` holds the ERROR reason to send back.
inline bool parse_command(std::string_view text, Command &out, std::string &reason)
{
    std::istringstream       iss{std::string(text)};
    std::vector<std::string> parts;
    for (std::string w; iss >> w;)
        parts.push_back(std::move(w));

    if (parts.empty() || parts[0] != "CONVERT")
    {
        reason = std::string(R_INVALID_COMMAND);
        return false;
    }
    if (parts.size() != 4)
    {
        reason = std::string(R_BAD_FORMAT);
        return false;
    }
    out.src      = strip_dot(parts[1]);
    out.dst      = strip_dot(parts[2]);
    out.filename = parts[3];
    if (out.src.empty() || out.dst.empty())
    {
        reason = std::string(R_BAD_FORMAT);
        return false;
    }
    return true;
}

}  // namespace proto
