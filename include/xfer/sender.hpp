#pragma once
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "crypto/digest.hpp"
#include "proto/packet.hpp"
#include "transport/itransport.hpp"
#include "util/errors.hpp"
#include "xfer/retransmit_timer.hpp"
#include "xfer/retry_policy.hpp"

namespace xfer
{

enum class SenderState
{
    Idle,
    SendingMetadata,
    SendingData,
    SendingHash,
    AwaitingComplete,
    Done,
    Failed
};

const char *state_name(SenderState s);

/*
Stop-and-wait sender for one byte stream:

  METADATA -> ACK, DATA[0..n-1] -> ACK each, HASH -> ACK, then wait for COMPLETE.

Exactly one unit is in flight. Each unit is retransmitted at most max_retries times; the next
timeout fails the whole transfer with TransferTimeout. Packets reach the engine through
on_packet(), called by whoever owns the transport's receive path.
*/
class Sender
{
  public:
    Sender(transport::ITransport &t, transport::Endpoint peer, RetryPolicy policy = {});
    ~Sender();

    Sender(const Sender &)            = delete;
    Sender &operator=(const Sender &) = delete;

    // Blocks until the peer reported COMPLETE or the transfer failed.
    udpconv::Error send(const std::string &filename, const std::string &mode,
                        const std::vector<std::uint8_t> &bytes);

    void on_packet(const proto::Packet &p);

    SenderState         state() const;
    udpconv::Error      error() const;
    std::string         peer_reason() const;     // text of a NACK or ERROR from the peer
    std::string         complete_payload() const;
    std::uint64_t       transmissions() const;   // datagrams put on the wire, retries included
    const transport::Endpoint &peer() const { return peer_; }

  private:
    void start_unit_locked(proto::Packet p);
    void transmit_locked();
    void arm_locked();
    void advance_locked();
    void fail_locked(udpconv::Error e);
    void finish_locked();
    void on_timeout(std::uint64_t epoch);
    bool terminal_locked() const
    {
        return state_ == SenderState::Done || state_ == SenderState::Failed;
    }

    transport::ITransport            &tx_;
    const transport::Endpoint         peer_;
    const RetryPolicy                 policy_;
    mutable std::mutex                mu_;
    std::condition_variable           cv_;
    SenderState                       state_{SenderState::Idle};
    udpconv::Error                    error_{udpconv::Error::Ok};
    std::string                       peer_reason_;
    std::string                       complete_payload_;
    const std::vector<std::uint8_t>  *data_{nullptr};
    std::uint32_t                     total_{0};
    std::uint32_t                     next_seq_{0};
    digest::Digest                    digest_{};
    proto::Packet                     outstanding_;
    std::uint32_t                     retries_{0};
    std::uint64_t                     epoch_{0};
    std::uint64_t                     transmissions_{0};
    RetransmitTimer                   timer_;  // last: joins before the members above go away
};

}  // namespace xfer
