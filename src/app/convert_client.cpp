#include <thread>

#include "app/convert_client.hpp"
#include "app/transfer_router.hpp"
#include "proto/control.hpp"
#include "session/channel.hpp"
#include "session/initiator.hpp"
#include "util/fileio.hpp"
#include "util/log.hpp"
#include "xfer/receiver.hpp"
#include "xfer/sender.hpp"

namespace app
{
using udpconv::Error;

ConvertClient::ConvertClient(ClientOptions opts, transport::TransportFactory factory)
    : opts_(std::move(opts)), factory_(std::move(factory))
{
}

Error ConvertClient::convert(const std::string &src, const std::string &dst,
                             const std::string &path, ClientResult &out)
{
    std::vector<std::uint8_t> bytes;
    std::string               err;
    if (!fileio::read_file(path, bytes, err))
    {
        LOG_ERROR("%s", err.c_str());
        return Error::Io;
    }

    proto::Command cmd;
    cmd.src      = proto::strip_dot(src);
    cmd.dst      = proto::strip_dot(dst);
    cmd.filename = fileio::safe_basename(path);
    return convert_bytes(cmd, bytes, out);
}

Error ConvertClient::convert_bytes(const proto::Command &cmd, const std::vector<std::uint8_t> &bytes,
                                   ClientResult &out)
{
    if (cmd.src.empty() || cmd.dst.empty() || cmd.filename.empty() ||
        cmd.filename.find_first_of(" \t\r\n") != std::string::npos ||
        cmd.filename.size() > proto::FILENAME_MAX_LEN)
    {
        LOG_ERROR("bad command: '%s'", proto::format_command(cmd).c_str());
        return Error::InvalidArgument;
    }
    if (bytes.empty() || bytes.size() > constants::MAX_FILE_BYTES)
    {
        LOG_ERROR("'%s' is %zu bytes; uploads must be 1..%zu bytes", cmd.filename.c_str(),
                  bytes.size(), constants::MAX_FILE_BYTES);
        return Error::InvalidArgument;
    }
    auto t = factory_ ? factory_() : nullptr;
    if (!t)
        return Error::Io;

    session::Channel ch(std::move(t));
    transport::Settings s{};
    s.bind_host = opts_.bind_host;
    s.bind_port = 0;

    session::Initiator hs(ch, opts_.policy);
    ch.set_handler([&hs](const proto::Packet &p, const transport::Endpoint &from) {
        hs.on_packet(p, from);
    });
    if (!ch.start(s))
    {
        LOG_ERROR("cannot open a local socket on %s", opts_.bind_host.c_str());
        return Error::Io;
    }

    Error e         = Error::Ok;
    auto  dedicated = hs.establish(opts_.server, proto::format_command(cmd), &e);
    if (!dedicated)
    {
        out.reason = hs.reason();
        ch.stop();
        return e == Error::Ok ? Error::PeerRejected : e;
    }
    ch.set_peer(*dedicated);

    auto deliver = [&](xfer::Delivery &&d, std::string &note) -> bool {
        std::string name = fileio::safe_basename(d.filename);
        if (name.empty())
        {
            note = std::string(proto::R_PROTOCOL_VIOLATION);
            return false;
        }
        std::string err;
        if (!fileio::write_file(opts_.output_dir, name, d.bytes, out.output_path, err))
        {
            note = "write_failed";
            return false;
        }
        out.output_name = name;
        out.bytes       = d.bytes.size();
        note            = name;
        return true;
    };

    xfer::Receiver rx(ch.transport(), *dedicated, deliver, opts_.policy);
    xfer::Sender   tx(ch.transport(), *dedicated, opts_.policy);
    ch.set_handler(make_router(rx, tx));

    e = tx.send(cmd.filename, cmd.mode(), bytes);
    if (e == Error::Ok)
    {
        LOG_INFO("upload accepted, server output '%s'", tx.complete_payload().c_str());
        e = rx.run();
        if (e == Error::Ok)
        {
            LOG_SYSTEM("result saved to %s (%zu bytes)", out.output_path.c_str(), out.bytes);
            // answer a retransmitted HASH if our COMPLETE was lost
            auto linger = opts_.linger.count() > 0 ? opts_.linger : opts_.policy.ack_timeout;
            std::this_thread::sleep_for(linger);
        }
        else
        {
            out.reason = rx.peer_reason();
        }
    }
    else
    {
        out.reason = tx.peer_reason();
        if (e == Error::PeerRejected && out.reason == proto::R_CONVERSION_FAILED)
            e = Error::Conversion;
    }

    ch.set_handler(nullptr);
    ch.stop();

    if (e != Error::Ok)
        LOG_SYSTEM("conversion of '%s' failed: %s%s%s", cmd.filename.c_str(),
                   udpconv::error_name(e), out.reason.empty() ? "" : " - ",
                   out.reason.c_str());
    return e;
}

}  // namespace app
