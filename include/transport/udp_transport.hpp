#pragma once
#include <atomic>
#include <mutex>
#include <thread>

#include "transport/itransport.hpp"

namespace transport
{

// IPv4 UDP socket with a poll()-driven receive thread.
class UdpTransport final : public ITransport
{
  public:
    UdpTransport() = default;
    ~UdpTransport() override;

    UdpTransport(const UdpTransport &)            = delete;
    UdpTransport &operator=(const UdpTransport &) = delete;

    bool        start(const Settings &s, OnDatagram on_rx) override;
    bool        send_to(const Endpoint &to, const Frame &datagram) override;
    void        stop() override;
    Endpoint    local() const override;
    std::string name() const override { return "udp"; }

  private:
    void rx_loop(int fd);

    int              fd_{-1};  // guarded by mu_ once the receive thread runs
    Settings         settings_{};
    OnDatagram       on_rx_{};
    Endpoint         local_{};
    std::thread      rx_thr_;
    std::atomic_bool running_{false};
    mutable std::mutex mu_;
};

}  // namespace transport
