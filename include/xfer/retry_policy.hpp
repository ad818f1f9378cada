#pragma once
#include <chrono>
#include <cstdint>

#include "util/config.hpp"
#include "util/constants.hpp"

namespace xfer
{

struct RetryPolicy
{
    std::chrono::milliseconds ack_timeout{constants::ACK_TIMEOUT_MS};
    std::uint32_t             max_retries{constants::MAX_RETRIES};  // retransmissions per unit
    std::chrono::milliseconds idle_timeout{constants::IDLE_TIMEOUT_MS};

    static RetryPolicy from_config(const config::Config &c)
    {
        RetryPolicy p;
        p.ack_timeout  = std::chrono::milliseconds(c.ack_timeout_ms);
        p.max_retries  = c.max_retries;
        p.idle_timeout = std::chrono::milliseconds(c.idle_timeout_ms);
        return p;
    }
};

}  // namespace xfer
