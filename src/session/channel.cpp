#include "session/channel.hpp"
#include "util/log.hpp"

namespace session
{

Channel::Channel(std::unique_ptr<transport::ITransport> t) : tx_(std::move(t)) {}

Channel::~Channel()
{
    stop();
}

bool Channel::start(const transport::Settings &s)
{
    if (!tx_)
        return false;
    if (!tx_->start(s, [this](const transport::Frame &f, const transport::Endpoint &from) {
            on_datagram(f, from);
        }))
        return false;
    std::lock_guard<std::mutex> lk(mu_);
    started_ = true;
    return true;
}

void Channel::stop()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!started_)
            return;
        started_ = false;
    }
    tx_->stop();
}

void Channel::set_handler(PacketHandler h)
{
    std::lock_guard<std::mutex> lk(dispatch_mu_);
    handler_ = std::move(h);
}

void Channel::set_peer(const transport::Endpoint &peer)
{
    std::lock_guard<std::mutex> lk(mu_);
    peer_ = peer;
}

std::optional<transport::Endpoint> Channel::peer() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return peer_;
}

bool Channel::send(const proto::Packet &p)
{
    auto to = peer();
    if (!to)
    {
        LOG_ERROR("Channel::send: no peer pinned");
        return false;
    }
    return send_to(*to, p);
}

bool Channel::send_to(const transport::Endpoint &to, const proto::Packet &p)
{
    auto frame = proto::encode(p);
    if (frame.empty())
        return false;
    return tx_->send_to(to, frame);
}

void Channel::on_datagram(const transport::Frame &f, const transport::Endpoint &from)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (peer_ && *peer_ != from)
        {
            LOG_DEBUG("dropping datagram from stranger %s on %s", from.to_string().c_str(),
                      tx_->local().to_string().c_str());
            return;
        }
    }

    // malformed datagrams are noise: no session to NACK yet
    auto p = proto::decode(f);
    if (!p)
    {
        LOG_DEBUG("dropping malformed datagram (%zu bytes) from %s", f.size(),
                  from.to_string().c_str());
        return;
    }

    std::lock_guard<std::mutex> dlk(dispatch_mu_);
    if (handler_)
        handler_(*p, from);
}

}  // namespace session
