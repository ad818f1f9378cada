#include <cerrno>
#include <cstdlib>
#include <string>

#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace config
{

bool parse_u32(const char *s, std::uint32_t lo, std::uint32_t hi, std::uint32_t &out)
{
    if (!s || !*s)
        return false;
    char         *end = nullptr;
    errno             = 0;
    unsigned long v   = std::strtoul(s, &end, 10);
    if (errno != 0 || !end || *end != '\0' || *s == '-')
        return false;
    if (v < lo || v > hi)
        return false;
    out = static_cast<std::uint32_t>(v);
    return true;
}

static void env_u32(const char *key, std::uint32_t lo, std::uint32_t hi, std::uint32_t &field)
{
    const char *e = std::getenv(key);
    if (!e)
        return;
    std::uint32_t v = 0;
    if (parse_u32(e, lo, hi, v))
    {
        field = v;
        LOG_DEBUG("%s=%u", key, v);
    }
    else
    {
        LOG_WARN("Ignoring invalid %s='%s' (expect %u..%u)", key, e, lo, hi);
    }
}

static void env_str(const char *key, std::string &field)
{
    if (const char *e = std::getenv(key); e && *e)
        field = e;
}

Config load_from_env(Role role)
{
    Config c;
    c.host            = std::string(constants::SERVER_HOST);
    c.bind            = std::string(constants::BIND_HOST);
    c.port            = constants::SERVER_PORT;
    c.ack_timeout_ms  = constants::ACK_TIMEOUT_MS;
    c.max_retries     = constants::MAX_RETRIES;
    c.idle_timeout_ms = constants::IDLE_TIMEOUT_MS;
    c.output_dir      = std::string(role == Role::Client ? constants::CLIENT_OUTPUT_DIR
                                                         : constants::SERVER_OUTPUT_DIR);

    env_str("UDPCONV_HOST", c.host);
    env_str("UDPCONV_BIND", c.bind);
    env_str("UDPCONV_OUTPUT_DIR", c.output_dir);

    std::uint32_t port = c.port;
    env_u32("UDPCONV_PORT", 1, 65535, port);
    c.port = static_cast<std::uint16_t>(port);

    env_u32("UDPCONV_ACK_TIMEOUT_MS", 10, 600000, c.ack_timeout_ms);
    env_u32("UDPCONV_MAX_RETRIES", 0, 100, c.max_retries);
    env_u32("UDPCONV_IDLE_TIMEOUT_MS", 100, 3600000, c.idle_timeout_ms);
    return c;
}

}  // namespace config
