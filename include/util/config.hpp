#pragma once
#include <cstdint>
#include <string>

namespace config
{

struct Config
{
    std::string   host;             // server address the client talks to
    std::string   bind;             // address the server listens on
    std::uint16_t port{0};          // well-known port
    std::uint32_t ack_timeout_ms{0};
    std::uint32_t max_retries{0};
    std::uint32_t idle_timeout_ms{0};
    std::string   output_dir;
};

enum class Role
{
    Client,
    Server
};

// Defaults overlaid with UDPCONV_* environment variables. Invalid values are logged and ignored.
Config load_from_env(Role role);

// Parse a decimal integer in [lo, hi]; false on garbage or out-of-range input.
bool parse_u32(const char *s, std::uint32_t lo, std::uint32_t hi, std::uint32_t &out);

}  // namespace config
