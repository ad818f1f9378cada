#include <algorithm>

#include "proto/control.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"
#include "xfer/sender.hpp"

namespace xfer
{
using proto::PacketType;
using udpconv::Error;

const char *state_name(SenderState s)
{
    switch (s)
    {
        case SenderState::Idle:
            return "IDLE";
        case SenderState::SendingMetadata:
            return "SENDING_METADATA";
        case SenderState::SendingData:
            return "SENDING_DATA";
        case SenderState::SendingHash:
            return "SENDING_HASH";
        case SenderState::AwaitingComplete:
            return "AWAITING_COMPLETE";
        case SenderState::Done:
            return "DONE";
        case SenderState::Failed:
            return "FAILED";
    }
    return "?";
}

Sender::Sender(transport::ITransport &t, transport::Endpoint peer, RetryPolicy policy)
    : tx_(t), peer_(std::move(peer)), policy_(policy)
{
}

Sender::~Sender()
{
    timer_.cancel();
}

Error Sender::send(const std::string &filename, const std::string &mode,
                   const std::vector<std::uint8_t> &bytes)
{
    std::unique_lock<std::mutex> lk(mu_);
    if (state_ != SenderState::Idle)
    {
        LOG_ERROR("send: engine already used (state=%s)", state_name(state_));
        return Error::InvalidArgument;
    }
    if (bytes.empty() || bytes.size() > constants::MAX_FILE_BYTES)
    {
        LOG_ERROR("send: refusing stream '%s' of %zu bytes", filename.c_str(), bytes.size());
        error_ = Error::InvalidArgument;
        state_ = SenderState::Failed;
        return error_;
    }
    if (filename.size() > proto::FILENAME_MAX_LEN || mode.size() > proto::MODE_MAX_LEN)
    {
        LOG_ERROR("send: name (%zu bytes) or mode (%zu bytes) too long for METADATA",
                  filename.size(), mode.size());
        error_ = Error::InvalidArgument;
        state_ = SenderState::Failed;
        return error_;
    }
    if (!digest::sha256(bytes, digest_))
    {
        error_ = Error::Io;
        state_ = SenderState::Failed;
        return error_;
    }

    data_     = &bytes;
    total_    = proto::chunks_for(bytes.size());
    next_seq_ = 0;

    proto::Metadata m;
    m.filename    = filename;
    m.byte_length = bytes.size();
    m.total_count = total_;
    m.mode        = mode;

    LOG_INFO("sending '%s' to %s: %zu bytes, %u packets, sha256=%.16s...", filename.c_str(),
             peer_.to_string().c_str(), bytes.size(), total_, digest::to_hex(digest_).c_str());

    state_ = SenderState::SendingMetadata;
    start_unit_locked(
        proto::make_packet(PacketType::Metadata, 0, total_, proto::encode_metadata(m)));

    cv_.wait(lk, [this] { return terminal_locked(); });
    data_ = nullptr;
    return error_;
}

void Sender::start_unit_locked(proto::Packet p)
{
    outstanding_ = std::move(p);
    retries_     = 0;
    transmit_locked();
    arm_locked();
}

void Sender::transmit_locked()
{
    auto frame = proto::encode(outstanding_);
    if (frame.empty())
    {
        fail_locked(Error::InvalidArgument);
        return;
    }
    transmissions_++;
    // a failed send is just a lost datagram; the timer covers it
    if (!tx_.send_to(peer_, frame))
        LOG_WARN("send_to %s failed for %s %u", peer_.to_string().c_str(),
                 proto::type_name(outstanding_.type), outstanding_.seq);
}

void Sender::arm_locked()
{
    if (terminal_locked())
        return;
    const std::uint64_t e = ++epoch_;
    timer_.arm(policy_.ack_timeout, [this, e] { on_timeout(e); });
}

void Sender::on_timeout(std::uint64_t epoch)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (epoch != epoch_ || terminal_locked())
        return;  // stale deadline

    if (retries_ >= policy_.max_retries)
    {
        LOG_ERROR("%s %u: no answer after %u retransmissions", proto::type_name(outstanding_.type),
                  outstanding_.seq, retries_);
        fail_locked(Error::TransferTimeout);
        return;
    }
    retries_++;
    LOG_WARN("[Timeout] retry %u/%u for %s %u (state=%s)", retries_, policy_.max_retries,
             proto::type_name(outstanding_.type), outstanding_.seq, state_name(state_));
    transmit_locked();
    arm_locked();
}

void Sender::advance_locked()
{
    switch (state_)
    {
        case SenderState::SendingMetadata:
            state_ = SenderState::SendingData;
            break;
        case SenderState::SendingData:
            next_seq_++;
            break;
        case SenderState::SendingHash:
            // keep HASH as the unit to repeat until COMPLETE shows up
            state_   = SenderState::AwaitingComplete;
            retries_ = 0;
            arm_locked();
            LOG_DEBUG("HASH acknowledged, waiting for COMPLETE");
            return;
        default:
            return;
    }

    if (next_seq_ < total_)
    {
        const std::size_t start = static_cast<std::size_t>(next_seq_) * proto::MAX_PAYLOAD;
        const std::size_t take  = std::min(proto::MAX_PAYLOAD, data_->size() - start);
        std::vector<std::uint8_t> chunk(data_->begin() + start, data_->begin() + start + take);
        LOG_DEBUG("[Send] packet %u/%u", next_seq_ + 1, total_);
        start_unit_locked(proto::make_packet(PacketType::Data, next_seq_, total_, std::move(chunk)));
        return;
    }

    state_ = SenderState::SendingHash;
    start_unit_locked(proto::make_packet(PacketType::Hash, 0, 0, digest::to_bytes(digest_)));
}

void Sender::on_packet(const proto::Packet &p)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (terminal_locked() || state_ == SenderState::Idle)
    {
        LOG_DEBUG("dropping %s %u in state %s", proto::type_name(p.type), p.seq,
                  state_name(state_));
        return;
    }

    switch (p.type)
    {
        case PacketType::Ack:
        {
            auto at = proto::acked_type(p);
            if (state_ != SenderState::AwaitingComplete && at && *at == outstanding_.type &&
                p.seq == outstanding_.seq)
            {
                timer_.cancel();
                advance_locked();
            }
            else
            {
                LOG_DEBUG("stale ACK for %s %u ignored", at ? proto::type_name(*at) : "?", p.seq);
            }
            return;
        }
        case PacketType::Nack:
        {
            auto at = proto::acked_type(p);
            if (!at || *at != outstanding_.type || p.seq != outstanding_.seq)
            {
                LOG_DEBUG("stale NACK ignored");
                return;
            }
            peer_reason_ = proto::nack_reason(p);
            LOG_ERROR("peer refused %s %u: %s", proto::type_name(*at), p.seq,
                      peer_reason_.c_str());
            fail_locked(*at == PacketType::Hash ? Error::IntegrityMismatch : Error::PeerRejected);
            return;
        }
        case PacketType::Error:
            peer_reason_ = proto::payload_text(p);
            LOG_ERROR("peer aborted the transfer: %s", peer_reason_.c_str());
            fail_locked(Error::PeerRejected);
            return;
        case PacketType::Complete:
            // COMPLETE implies the HASH arrived even if its ACK got lost
            if (state_ == SenderState::AwaitingComplete || state_ == SenderState::SendingHash)
            {
                complete_payload_ = proto::payload_text(p);
                finish_locked();
            }
            else
            {
                LOG_WARN("COMPLETE before HASH (state=%s), ignored", state_name(state_));
            }
            return;
        default:
            LOG_WARN("protocol violation: %s not valid for a sender", proto::type_name(p.type));
            return;
    }
}

void Sender::finish_locked()
{
    timer_.cancel();
    state_ = SenderState::Done;
    LOG_INFO("transfer to %s complete (%llu datagrams)", peer_.to_string().c_str(),
             static_cast<unsigned long long>(transmissions_));
    cv_.notify_all();
}

void Sender::fail_locked(Error e)
{
    timer_.cancel();
    error_ = e;
    state_ = SenderState::Failed;
    cv_.notify_all();
}

SenderState Sender::state() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

Error Sender::error() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return error_;
}

std::string Sender::peer_reason() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return peer_reason_;
}

std::string Sender::complete_payload() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return complete_payload_;
}

std::uint64_t Sender::transmissions() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return transmissions_;
}

}  // namespace xfer
