#pragma once
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "proto/packet.hpp"
#include "session/channel.hpp"
#include "transport/itransport.hpp"
#include "util/errors.hpp"
#include "xfer/retransmit_timer.hpp"
#include "xfer/retry_policy.hpp"

namespace session
{

/*
Client half of the handshake:

  COMMAND(nonce) ---------------------------> well-known
  <------------- OK(nonce, dedicated port) -- well-known
  <------------- OK(nonce) | ERROR(reason) -- dedicated

COMMAND is repeated on timeout; the responder recognises the nonce and answers again without
allocating a second session.
*/
class Initiator
{
  public:
    Initiator(Channel &ch, xfer::RetryPolicy policy = {});
    ~Initiator();

    Initiator(const Initiator &)            = delete;
    Initiator &operator=(const Initiator &) = delete;

    std::optional<transport::Endpoint> establish(const transport::Endpoint &well_known,
                                                 const std::string         &command_text,
                                                 udpconv::Error            *err = nullptr);

    void on_packet(const proto::Packet &p, const transport::Endpoint &from);

    std::string   reason() const;
    std::uint32_t nonce() const;

  private:
    enum class Phase
    {
        Idle,
        AwaitRedirect,
        AwaitReady,
        Ready,
        Failed
    };

    void send_command_locked();
    void arm_locked();
    void on_timeout(std::uint64_t epoch);
    void fail_locked(udpconv::Error e);

    Channel                 &ch_;
    const xfer::RetryPolicy  policy_;
    mutable std::mutex       mu_;
    std::condition_variable  cv_;
    Phase                    phase_{Phase::Idle};
    udpconv::Error           error_{udpconv::Error::Ok};
    std::string              reason_;
    std::uint32_t            nonce_{0};
    transport::Endpoint      well_known_{};
    transport::Endpoint      dedicated_{};
    proto::Packet            command_;
    std::uint32_t            retries_{0};
    std::uint64_t            epoch_{0};
    xfer::RetransmitTimer    timer_;
};

}  // namespace session
