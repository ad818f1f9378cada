#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace transport
{

using Frame = std::vector<std::uint8_t>;

struct Endpoint
{
    std::string   host;
    std::uint16_t port{0};

    bool operator==(const Endpoint &o) const { return port == o.port && host == o.host; }
    bool operator!=(const Endpoint &o) const { return !(*this == o); }
    bool operator<(const Endpoint &o) const
    {
        return host < o.host || (host == o.host && port < o.port);
    }
    std::string to_string() const { return host + ":" + std::to_string(port); }
};

using OnDatagram = std::function<void(const Frame &, const Endpoint &from)>;

struct Settings
{
    std::string   bind_host = "0.0.0.0";
    std::uint16_t bind_port = 0;  // 0 = ephemeral
    std::size_t   max_datagram = 1033;
};

// Unreliable datagram channel. on_rx runs on the transport's own receive thread.
struct ITransport
{
    virtual bool        start(const Settings &s, OnDatagram on_rx)         = 0;
    virtual bool        send_to(const Endpoint &to, const Frame &datagram) = 0;
    virtual void        stop()                                             = 0;
    virtual Endpoint    local() const                                      = 0;
    virtual std::string name() const { return ""; }
    virtual ~ITransport() = default;
};

using TransportFactory = std::function<std::unique_ptr<ITransport>()>;

}  // namespace transport
