#pragma once
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "crypto/digest.hpp"
#include "proto/control.hpp"
#include "proto/packet.hpp"
#include "proto/reassembly.hpp"
#include "transport/itransport.hpp"
#include "util/errors.hpp"
#include "xfer/retransmit_timer.hpp"
#include "xfer/retry_policy.hpp"

namespace xfer
{

enum class ReceiverState
{
    AwaitingMetadata,
    ReceivingData,
    AwaitingHash,
    Verifying,
    Verified,
    Complete,
    Failed
};

const char *state_name(ReceiverState s);

struct Delivery
{
    std::string               filename;
    std::string               mode;
    std::vector<std::uint8_t> bytes;  // reassembled and verified
};

// Called once with the verified stream. On success `note` becomes the COMPLETE payload; on
// failure it is the reason sent back in an ERROR packet.
using OnDeliver = std::function<bool(Delivery &&d, std::string &note)>;

class Receiver
{
  public:
    Receiver(transport::ITransport &t, transport::Endpoint peer, OnDeliver deliver,
             RetryPolicy policy = {});
    ~Receiver();

    Receiver(const Receiver &)            = delete;
    Receiver &operator=(const Receiver &) = delete;

    // Blocks until the stream is verified and delivered (then sends COMPLETE) or failed.
    udpconv::Error run();

    void on_packet(const proto::Packet &p);

    ReceiverState   state() const;
    udpconv::Error  error() const;
    std::string     peer_reason() const;
    proto::Metadata metadata() const;
    std::uint32_t   acks_sent() const;
    std::uint32_t   chunks_received() const;

  private:
    void on_metadata(const proto::Packet &p);
    void on_data(const proto::Packet &p);
    void on_hash(const proto::Packet &p);
    void reply(const proto::Packet &p);
    void kick_watchdog_locked();
    void on_idle(std::uint64_t epoch);
    void fail_locked(udpconv::Error e);
    bool before_verified_locked() const
    {
        return state_ == ReceiverState::AwaitingMetadata ||
               state_ == ReceiverState::ReceivingData || state_ == ReceiverState::AwaitingHash ||
               state_ == ReceiverState::Verifying;
    }

    transport::ITransport    &tx_;
    const transport::Endpoint peer_;
    OnDeliver                 deliver_;
    const RetryPolicy         policy_;
    mutable std::mutex        mu_;
    std::condition_variable   cv_;
    ReceiverState             state_{ReceiverState::AwaitingMetadata};
    udpconv::Error            error_{udpconv::Error::Ok};
    std::string               peer_reason_;
    proto::Metadata           meta_;
    proto::Reassembler        reasm_;
    std::vector<std::uint8_t> verified_;
    std::string               complete_note_;
    std::uint32_t             acks_sent_{0};
    std::uint64_t             epoch_{0};
    RetransmitTimer           watchdog_;  // last: joins before the members above go away
};

}  // namespace xfer
