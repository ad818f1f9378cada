#include <sodium.h>

#include "proto/control.hpp"
#include "session/initiator.hpp"
#include "util/log.hpp"

namespace session
{
using proto::PacketType;
using udpconv::Error;

Initiator::Initiator(Channel &ch, xfer::RetryPolicy policy) : ch_(ch), policy_(policy) {}

Initiator::~Initiator()
{
    timer_.cancel();
}

std::optional<transport::Endpoint> Initiator::establish(const transport::Endpoint &well_known,
                                                        const std::string         &command_text,
                                                        Error                     *err)
{
    std::unique_lock<std::mutex> lk(mu_);
    if (phase_ != Phase::Idle)
    {
        LOG_ERROR("establish: handshake already used");
        udpconv::set_error(err, Error::InvalidArgument);
        return std::nullopt;
    }
    if (command_text.empty() || command_text.size() > proto::MAX_PAYLOAD)
    {
        udpconv::set_error(err, Error::InvalidArgument);
        return std::nullopt;
    }
    if (sodium_init() < 0)
    {
        LOG_ERROR("sodium_init failed");
        udpconv::set_error(err, Error::Io);
        return std::nullopt;
    }

    nonce_      = randombytes_random();
    well_known_ = well_known;
    command_    = proto::make_text(PacketType::Command, command_text, nonce_);
    phase_      = Phase::AwaitRedirect;
    LOG_DEBUG("COMMAND '%s' -> %s (nonce=%08x)", command_text.c_str(),
              well_known.to_string().c_str(), nonce_);
    send_command_locked();
    arm_locked();

    cv_.wait(lk, [this] { return phase_ == Phase::Ready || phase_ == Phase::Failed; });
    timer_.cancel();
    udpconv::set_error(err, error_);
    if (phase_ != Phase::Ready)
        return std::nullopt;
    return dedicated_;
}

void Initiator::send_command_locked()
{
    if (!ch_.send_to(well_known_, command_))
        LOG_WARN("COMMAND send to %s failed", well_known_.to_string().c_str());
}

void Initiator::arm_locked()
{
    const std::uint64_t e = ++epoch_;
    timer_.arm(policy_.ack_timeout, [this, e] { on_timeout(e); });
}

void Initiator::on_timeout(std::uint64_t epoch)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (epoch != epoch_ || (phase_ != Phase::AwaitRedirect && phase_ != Phase::AwaitReady))
        return;
    if (retries_ >= policy_.max_retries)
    {
        LOG_ERROR("no answer from %s after %u retransmissions", well_known_.to_string().c_str(),
                  retries_);
        fail_locked(Error::TransferTimeout);
        return;
    }
    retries_++;
    LOG_WARN("[Timeout] retry %u/%u for COMMAND", retries_, policy_.max_retries);
    send_command_locked();
    arm_locked();
}

void Initiator::fail_locked(Error e)
{
    timer_.cancel();
    error_ = e;
    phase_ = Phase::Failed;
    cv_.notify_all();
}

void Initiator::on_packet(const proto::Packet &p, const transport::Endpoint &from)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (phase_ != Phase::AwaitRedirect && phase_ != Phase::AwaitReady)
        return;
    if (p.seq != nonce_)
    {
        LOG_DEBUG("ignoring %s for another handshake", proto::type_name(p.type));
        return;
    }

    const bool from_wk  = (from == well_known_);
    const bool from_ded = (phase_ == Phase::AwaitReady && from == dedicated_);

    if (p.type == PacketType::Error && (from_wk || from_ded))
    {
        reason_ = proto::payload_text(p);
        LOG_ERROR("command refused by %s: %s", from.to_string().c_str(), reason_.c_str());
        fail_locked(Error::PeerRejected);
        return;
    }
    if (p.type != PacketType::Ok)
    {
        LOG_WARN("protocol violation: %s during handshake", proto::type_name(p.type));
        return;
    }

    if (from_wk)
    {
        auto port = proto::parse_redirect(p);
        if (!port)
        {
            LOG_WARN("malformed redirect from %s", from.to_string().c_str());
            return;
        }
        if (phase_ == Phase::AwaitRedirect)
        {
            dedicated_ = transport::Endpoint{from.host, *port};
            phase_     = Phase::AwaitReady;
            retries_   = 0;
            arm_locked();
            LOG_INFO("redirected to port %u", (unsigned)*port);
        }
        return;
    }

    if (from_ded)
    {
        timer_.cancel();
        phase_ = Phase::Ready;
        LOG_DEBUG("dedicated address %s ready", dedicated_.to_string().c_str());
        cv_.notify_all();
    }
}

std::string Initiator::reason() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return reason_;
}

std::uint32_t Initiator::nonce() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return nonce_;
}

}  // namespace session
