#include "util/constants.hpp"
#include "util/log.hpp"
#include "xfer/receiver.hpp"

namespace xfer
{
using proto::PacketType;
using udpconv::Error;

const char *state_name(ReceiverState s)
{
    switch (s)
    {
        case ReceiverState::AwaitingMetadata:
            return "AWAITING_METADATA";
        case ReceiverState::ReceivingData:
            return "RECEIVING_DATA";
        case ReceiverState::AwaitingHash:
            return "AWAITING_HASH";
        case ReceiverState::Verifying:
            return "VERIFYING";
        case ReceiverState::Verified:
            return "VERIFIED";
        case ReceiverState::Complete:
            return "COMPLETE";
        case ReceiverState::Failed:
            return "FAILED";
    }
    return "?";
}

Receiver::Receiver(transport::ITransport &t, transport::Endpoint peer, OnDeliver deliver,
                   RetryPolicy policy)
    : tx_(t), peer_(std::move(peer)), deliver_(std::move(deliver)), policy_(policy)
{
}

Receiver::~Receiver()
{
    watchdog_.cancel();
}

Error Receiver::run()
{
    std::unique_lock<std::mutex> lk(mu_);
    if (before_verified_locked())
        kick_watchdog_locked();
    cv_.wait(lk, [this] {
        return state_ == ReceiverState::Verified || state_ == ReceiverState::Complete ||
               state_ == ReceiverState::Failed;
    });
    if (state_ != ReceiverState::Verified)
        return error_;

    Delivery d;
    d.filename = meta_.filename;
    d.mode     = meta_.mode;
    d.bytes    = std::move(verified_);
    verified_.clear();
    lk.unlock();

    // hand off outside the lock; retransmitted HASHes are re-ACKed meanwhile
    std::string note;
    const bool  ok = deliver_ ? deliver_(std::move(d), note) : true;

    lk.lock();
    if (!ok)
    {
        if (note.empty())
            note = std::string(proto::R_CONVERSION_FAILED);
        LOG_ERROR("delivery of '%s' failed: %s", meta_.filename.c_str(), note.c_str());
        reply(proto::make_text(PacketType::Error, note));
        fail_locked(Error::Conversion);
        return error_;
    }
    complete_note_ = note;
    state_         = ReceiverState::Complete;
    reply(proto::make_text(PacketType::Complete, complete_note_));
    LOG_INFO("'%s' delivered, COMPLETE sent to %s", meta_.filename.c_str(),
             peer_.to_string().c_str());
    cv_.notify_all();
    return Error::Ok;
}

void Receiver::reply(const proto::Packet &p)
{
    auto frame = proto::encode(p);
    if (frame.empty())
        return;
    if (p.type == PacketType::Ack)
        acks_sent_++;
    if (!tx_.send_to(peer_, frame))
        LOG_WARN("send_to %s failed for %s", peer_.to_string().c_str(), proto::type_name(p.type));
}

void Receiver::kick_watchdog_locked()
{
    const std::uint64_t e = ++epoch_;
    watchdog_.arm(policy_.idle_timeout, [this, e] { on_idle(e); });
}

void Receiver::on_idle(std::uint64_t epoch)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (epoch != epoch_ || !before_verified_locked())
        return;
    LOG_ERROR("no progress from %s for %lld ms (state=%s)", peer_.to_string().c_str(),
              static_cast<long long>(policy_.idle_timeout.count()), state_name(state_));
    fail_locked(Error::TransferTimeout);
}

void Receiver::fail_locked(Error e)
{
    watchdog_.cancel();
    error_ = e;
    state_ = ReceiverState::Failed;
    verified_.clear();
    (void)reasm_.reset(0);
    cv_.notify_all();
}

void Receiver::on_packet(const proto::Packet &p)
{
    std::lock_guard<std::mutex> lk(mu_);
    switch (p.type)
    {
        case PacketType::Metadata:
            on_metadata(p);
            return;
        case PacketType::Data:
            on_data(p);
            return;
        case PacketType::Hash:
            on_hash(p);
            return;
        case PacketType::Error:
            if (before_verified_locked())
            {
                peer_reason_ = proto::payload_text(p);
                LOG_ERROR("peer aborted the transfer: %s", peer_reason_.c_str());
                fail_locked(Error::PeerRejected);
            }
            return;
        default:
            LOG_WARN("protocol violation: %s not valid for a receiver (state=%s)",
                     proto::type_name(p.type), state_name(state_));
            return;
    }
}

void Receiver::on_metadata(const proto::Packet &p)
{
    proto::Metadata m;
    const bool      parsed = proto::parse_metadata(p.payload.data(), p.payload.size(), m);

    if (state_ != ReceiverState::AwaitingMetadata)
    {
        // our ACK got lost: repeat it, but only for the record we accepted
        if (state_ != ReceiverState::Failed && parsed && m == meta_)
            reply(proto::make_ack(PacketType::Metadata, p.seq));
        else
            LOG_WARN("protocol violation: new METADATA in state %s", state_name(state_));
        return;
    }

    const char *why = nullptr;
    if (!parsed)
        why = "malformed_metadata";
    else if (m.byte_length == 0)
        why = "empty_file";
    else if (m.byte_length > constants::MAX_FILE_BYTES)
        why = "too_large";
    else if (m.total_count == 0 || m.total_count != proto::chunks_for(m.byte_length))
        why = "inconsistent_total";
    else if (p.total != m.total_count)
        why = "header_total_mismatch";
    else if (!reasm_.reset(m.total_count))
        why = "too_large";

    if (why)
    {
        LOG_WARN("rejecting METADATA from %s: %s", peer_.to_string().c_str(), why);
        reply(proto::make_nack(PacketType::Metadata, p.seq, why));
        kick_watchdog_locked();
        return;
    }

    meta_ = std::move(m);
    state_ = ReceiverState::ReceivingData;
    LOG_INFO("receiving '%s' (%s): %llu bytes, %u packets", meta_.filename.c_str(),
             meta_.mode.c_str(), static_cast<unsigned long long>(meta_.byte_length),
             meta_.total_count);
    reply(proto::make_ack(PacketType::Metadata, p.seq));
    kick_watchdog_locked();
}

void Receiver::on_data(const proto::Packet &p)
{
    switch (state_)
    {
        case ReceiverState::ReceivingData:
        case ReceiverState::AwaitingHash:
            break;
        case ReceiverState::Verifying:
        case ReceiverState::Verified:
        case ReceiverState::Complete:
            // late duplicate after verification; the buffer is gone, just ACK it again
            if (p.total == meta_.total_count && p.seq < meta_.total_count)
                reply(proto::make_ack(PacketType::Data, p.seq));
            return;
        default:
            LOG_WARN("protocol violation: DATA %u in state %s", p.seq, state_name(state_));
            return;
    }

    const Error e = reasm_.accept(p.seq, p.total, p.payload);
    if (e != Error::Ok)
    {
        // no ACK: the sender retries and eventually times out
        LOG_WARN("dropping DATA %u/%u: %s", p.seq, p.total, udpconv::error_name(e));
        return;
    }
    reply(proto::make_ack(PacketType::Data, p.seq));
    kick_watchdog_locked();
    LOG_DEBUG("[Recv] packet %u/%u", p.seq + 1, meta_.total_count);

    if (state_ == ReceiverState::ReceivingData && reasm_.is_complete())
    {
        state_ = ReceiverState::AwaitingHash;
        LOG_DEBUG("all %u packets in, waiting for HASH", meta_.total_count);
    }
}

void Receiver::on_hash(const proto::Packet &p)
{
    switch (state_)
    {
        case ReceiverState::AwaitingHash:
            break;
        case ReceiverState::Verified:
            reply(proto::make_ack(PacketType::Hash, p.seq));
            return;
        case ReceiverState::Complete:
            // our COMPLETE may have been lost too
            reply(proto::make_ack(PacketType::Hash, p.seq));
            reply(proto::make_text(PacketType::Complete, complete_note_));
            return;
        case ReceiverState::Failed:
            if (error_ == Error::IntegrityMismatch)
                reply(proto::make_nack(PacketType::Hash, p.seq, "hash_mismatch"));
            return;
        default:
            LOG_WARN("protocol violation: HASH in state %s", state_name(state_));
            return;
    }

    state_ = ReceiverState::Verifying;

    Error err   = Error::Ok;
    auto  bytes = reasm_.assemble(&err);
    if (!bytes)
    {
        // unreachable while AwaitingHash implies completeness
        LOG_ERROR("assemble failed: %s", udpconv::error_name(err));
        fail_locked(err);
        return;
    }

    auto           expected = digest::from_bytes(p.payload);
    digest::Digest actual{};
    const bool     hashed   = digest::sha256(*bytes, actual);
    const bool     len_ok   = bytes->size() == meta_.byte_length;

    if (!expected || !hashed || !len_ok || !digest::equal(*expected, actual))
    {
        LOG_ERROR("integrity check failed for '%s' (%zu/%llu bytes, sha256=%s)",
                  meta_.filename.c_str(), bytes->size(),
                  static_cast<unsigned long long>(meta_.byte_length),
                  digest::to_hex(actual).c_str());
        reply(proto::make_nack(PacketType::Hash, p.seq, "hash_mismatch"));
        fail_locked(Error::IntegrityMismatch);
        return;
    }

    watchdog_.cancel();
    verified_ = std::move(*bytes);
    (void)reasm_.reset(0);
    state_ = ReceiverState::Verified;
    LOG_INFO("sha256 verified for '%s': %.16s...", meta_.filename.c_str(),
             digest::to_hex(actual).c_str());
    reply(proto::make_ack(PacketType::Hash, p.seq));
    cv_.notify_all();
}

ReceiverState Receiver::state() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

Error Receiver::error() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return error_;
}

std::string Receiver::peer_reason() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return peer_reason_;
}

proto::Metadata Receiver::metadata() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return meta_;
}

std::uint32_t Receiver::acks_sent() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return acks_sent_;
}

std::uint32_t Receiver::chunks_received() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return reasm_.received();
}

}  // namespace xfer
