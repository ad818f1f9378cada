#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

#include "transport/itransport.hpp"

namespace transport
{

// In-memory datagram network for tests: every LoopbackTransport attached to the same hub can
// reach the others by port. Delivery is asynchronous on the hub's own thread, so a callback may
// send without re-entering the sender. A filter can drop datagrams to simulate loss.
class LoopbackHub
{
  public:
    static constexpr const char *HOST = "loopback";

    // return false to drop the datagram
    using Filter = std::function<bool(const Endpoint &from, const Endpoint &to, const Frame &)>;

    LoopbackHub();
    ~LoopbackHub();

    LoopbackHub(const LoopbackHub &)            = delete;
    LoopbackHub &operator=(const LoopbackHub &) = delete;

    // port 0 picks a free one; returns 0 if the requested port is taken
    std::uint16_t attach(std::uint16_t port, OnDatagram on_rx);
    void          detach(std::uint16_t port);
    bool          post(const Endpoint &from, const Endpoint &to, const Frame &f);

    void set_filter(Filter f);

    // blocks until the queue is empty and no callback is running
    void wait_idle();

    std::size_t delivered() const { return delivered_.load(); }
    std::size_t dropped() const { return dropped_.load(); }

  private:
    struct Item
    {
        Endpoint from;
        Endpoint to;
        Frame    frame;
    };

    void run();

    std::mutex                                           mu_;
    std::condition_variable                              cv_;
    std::condition_variable                              idle_cv_;
    std::deque<Item>                                     queue_;
    std::map<std::uint16_t, std::shared_ptr<OnDatagram>> ports_;
    std::uint16_t                                        next_port_{40000};
    Filter                                               filter_{};
    bool                                                 busy_{false};
    bool                                                 stop_{false};
    std::mutex                                           dispatch_mu_;
    std::thread                                          thr_;
    std::atomic<std::size_t>                             delivered_{0};
    std::atomic<std::size_t>                             dropped_{0};
};

class LoopbackTransport final : public ITransport
{
  public:
    explicit LoopbackTransport(LoopbackHub &hub) : hub_(hub) {}
    ~LoopbackTransport() override { stop(); }

    bool        start(const Settings &s, OnDatagram on_rx) override;
    bool        send_to(const Endpoint &to, const Frame &datagram) override;
    void        stop() override;
    Endpoint    local() const override { return Endpoint{LoopbackHub::HOST, port_.load()}; }
    std::string name() const override { return "loopback"; }

  private:
    LoopbackHub               &hub_;
    std::atomic<std::uint16_t> port_{0};
    std::size_t                max_{0};
    std::atomic_bool           started_{false};
};

}  // namespace transport
