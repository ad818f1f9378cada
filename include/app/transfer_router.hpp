#pragma once
#include "proto/packet.hpp"
#include "session/channel.hpp"
#include "xfer/receiver.hpp"
#include "xfer/sender.hpp"

namespace app
{

// Both directions of a conversion share one dedicated address: stream packets go to the
// receiver, acknowledgements and COMPLETE to the sender, ERROR to both.
inline session::PacketHandler make_router(xfer::Receiver &rx, xfer::Sender &tx)
{
    return [&rx, &tx](const proto::Packet &p, const transport::Endpoint & /*from*/) {
        switch (p.type)
        {
            case proto::PacketType::Metadata:
            case proto::PacketType::Data:
            case proto::PacketType::Hash:
                rx.on_packet(p);
                break;
            case proto::PacketType::Ack:
            case proto::PacketType::Nack:
            case proto::PacketType::Complete:
                tx.on_packet(p);
                break;
            case proto::PacketType::Error:
                tx.on_packet(p);
                rx.on_packet(p);
                break;
            default:
                // late handshake replies (repeated OK) are harmless
                break;
        }
    };
}

}  // namespace app
