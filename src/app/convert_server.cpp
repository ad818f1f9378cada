#include <cstdio>
#include <sodium.h>
#include <vector>

#include "app/convert_server.hpp"
#include "app/transfer_router.hpp"
#include "proto/control.hpp"
#include "util/fileio.hpp"
#include "util/log.hpp"
#include "xfer/receiver.hpp"
#include "xfer/sender.hpp"

namespace app
{
using udpconv::Error;

std::string output_name(const std::string &filename, const std::string &dst)
{
    std::string stem = fileio::stem(fileio::safe_basename(filename));
    if (stem.empty())
        stem = "file";

    // "_" + 8 hex + "." + dst must still fit in a METADATA filename
    const std::size_t suffix = 1 + 8 + 1 + dst.size();
    const std::size_t room =
        proto::FILENAME_MAX_LEN > suffix ? proto::FILENAME_MAX_LEN - suffix : 0;
    if (stem.size() > room)
    {
        stem.resize(room);
        // do not leave half a UTF-8 sequence behind
        while (!stem.empty() && (static_cast<unsigned char>(stem.back()) & 0xC0) == 0x80)
            stem.pop_back();
        if (!stem.empty() && (static_cast<unsigned char>(stem.back()) & 0xC0) == 0xC0)
            stem.pop_back();
    }
    char tag[9];
    std::snprintf(tag, sizeof tag, "%08x", randombytes_random());
    return stem + "_" + tag + "." + dst;
}

ConvertServer::ConvertServer(ServerOptions opts, convert::TransformRegistry transforms,
                             transport::TransportFactory factory)
    : opts_(std::move(opts)), transforms_(std::move(transforms)), factory_(std::move(factory))
{
}

ConvertServer::~ConvertServer()
{
    stop();
}

bool ConvertServer::start()
{
    if (responder_)
        return true;
    if (!factory_)
    {
        LOG_ERROR("no transport factory");
        return false;
    }
    if (sodium_init() < 0)
    {
        LOG_ERROR("sodium_init failed");
        return false;
    }

    auto wk = factory_();
    if (!wk)
        return false;

    session::ResponderOptions ro;
    ro.bind_host    = opts_.bind_host;
    ro.max_sessions = opts_.max_sessions;

    responder_ = std::make_unique<session::Responder>(
        std::move(wk), factory_,
        [this](const std::string &text, std::string &reason) { return check(text, reason); },
        [this](session::Channel &ch, const std::string &text, const std::function<void()> &ready) {
            serve(ch, text, ready);
        },
        ro);

    transport::Settings s{};
    s.bind_host = opts_.bind_host;
    s.bind_port = opts_.port;
    if (!responder_->start(s))
    {
        responder_.reset();
        return false;
    }
    LOG_SYSTEM("conversion server on %s, output in '%s'", responder_->local().to_string().c_str(),
               opts_.output_dir.c_str());
    return true;
}

void ConvertServer::stop()
{
    if (!responder_)
        return;
    responder_->stop();
    responder_.reset();
    LOG_INFO("server stopped (%llu completed, %llu failed)",
             static_cast<unsigned long long>(completed_.load()),
             static_cast<unsigned long long>(failed_.load()));
}

transport::Endpoint ConvertServer::local() const
{
    return responder_ ? responder_->local() : transport::Endpoint{};
}

std::size_t ConvertServer::active_sessions()
{
    return responder_ ? responder_->active_sessions() : 0;
}

bool ConvertServer::check(const std::string &command_text, std::string &reason) const
{
    proto::Command cmd;
    if (!proto::parse_command(command_text, cmd, reason))
        return false;
    if (!transforms_.supports(cmd.src, cmd.dst))
    {
        reason = std::string(proto::R_UNSUPPORTED);
        return false;
    }
    return true;
}

void ConvertServer::serve(session::Channel &ch, const std::string &command_text,
                          const std::function<void()> &ready)
{
    proto::Command cmd;
    std::string    reason;
    auto           peer = ch.peer();
    if (!peer || !proto::parse_command(command_text, cmd, reason))
        return;

    std::vector<std::uint8_t> result;
    std::string               result_name;

    auto deliver = [&](xfer::Delivery &&d, std::string &note) -> bool {
        if (d.mode != cmd.mode())
        {
            LOG_WARN("upload mode '%s' does not match command '%s'", d.mode.c_str(),
                     cmd.mode().c_str());
            note = std::string(proto::R_PROTOCOL_VIOLATION);
            return false;
        }
        std::string err;
        if (!transforms_.run(d.mode, d.filename, d.bytes, result, err))
        {
            LOG_ERROR("conversion of '%s' failed: %s", d.filename.c_str(), err.c_str());
            note = std::string(proto::R_CONVERSION_FAILED);
            return false;
        }
        result_name = output_name(d.filename, cmd.dst);
        std::string path;
        if (!fileio::write_file(opts_.output_dir, result_name, result, path, err))
        {
            note = std::string(proto::R_CONVERSION_FAILED);
            return false;
        }
        LOG_SYSTEM("converted '%s' -> %s (%zu bytes)", d.filename.c_str(), path.c_str(),
                   result.size());
        note = result_name;
        return true;
    };

    xfer::Receiver rx(ch.transport(), *peer, deliver, opts_.policy);
    xfer::Sender   tx(ch.transport(), *peer, opts_.policy);
    ch.set_handler(make_router(rx, tx));
    ready();

    Error e = rx.run();
    if (e == Error::Ok)
        e = tx.send(result_name, cmd.mode(), result);

    // engines go out of scope below; nothing may dispatch into them afterwards
    ch.set_handler(nullptr);

    if (e == Error::Ok)
    {
        completed_++;
        LOG_INFO("session with %s complete: '%s' returned", peer->to_string().c_str(),
                 result_name.c_str());
    }
    else
    {
        failed_++;
        LOG_ERROR("session with %s failed: %s", peer->to_string().c_str(),
                  udpconv::error_name(e));
    }
}

}  // namespace app
