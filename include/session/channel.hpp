#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "proto/packet.hpp"
#include "transport/itransport.hpp"

namespace session
{

using PacketHandler = std::function<void(const proto::Packet &, const transport::Endpoint &from)>;

// One transport plus the decode step and packet routing in front of it. Once a peer is pinned,
// datagrams from anyone else are dropped, so two transfers never see each other's packets.
class Channel
{
  public:
    explicit Channel(std::unique_ptr<transport::ITransport> t);
    ~Channel();

    Channel(const Channel &)            = delete;
    Channel &operator=(const Channel &) = delete;

    bool start(const transport::Settings &s);
    void stop();

    // Returns only after any call into the previous handler has finished. Must not be called
    // from inside a handler.
    void set_handler(PacketHandler h);
    void set_peer(const transport::Endpoint &peer);
    std::optional<transport::Endpoint> peer() const;

    bool send(const proto::Packet &p);
    bool send_to(const transport::Endpoint &to, const proto::Packet &p);

    transport::ITransport &transport() { return *tx_; }
    transport::Endpoint    local() const { return tx_->local(); }

  private:
    void on_datagram(const transport::Frame &f, const transport::Endpoint &from);

    std::unique_ptr<transport::ITransport> tx_;
    mutable std::mutex                     mu_;
    std::mutex                             dispatch_mu_;  // held while the handler runs
    PacketHandler                          handler_{};
    std::optional<transport::Endpoint>     peer_{};
    bool                                   started_{false};
};

}  // namespace session
