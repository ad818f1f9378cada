#include "proto/control.hpp"
#include "session/responder.hpp"
#include "util/log.hpp"

namespace session
{
using proto::PacketType;

Responder::Responder(std::unique_ptr<transport::ITransport> well_known,
                     transport::TransportFactory            factory,
                     CommandCheck                           check,
                     SessionHandler                         handler,
                     ResponderOptions                       opts)
    : wk_(std::move(well_known)),
      factory_(std::move(factory)),
      check_(std::move(check)),
      handler_(std::move(handler)),
      opts_(std::move(opts))
{
}

Responder::~Responder()
{
    stop();
}

bool Responder::start(const transport::Settings &s)
{
    wk_.set_handler(
        [this](const proto::Packet &p, const transport::Endpoint &from) { on_packet(p, from); });
    if (!wk_.start(s))
    {
        LOG_ERROR("cannot listen on %s:%u", s.bind_host.c_str(), (unsigned)s.bind_port);
        return false;
    }
    accepting_.store(true);
    LOG_INFO("listening on %s", wk_.local().to_string().c_str());
    return true;
}

void Responder::stop()
{
    if (!accepting_.exchange(false))
        return;
    wk_.stop();
    registry_.join_all();
}

void Responder::on_packet(const proto::Packet &p, const transport::Endpoint &from)
{
    if (!accepting_.load())
        return;
    registry_.reap();

    if (p.type != PacketType::Command)
    {
        // transfer traffic belongs on a dedicated port only
        LOG_WARN("protocol violation: %s %u from %s on the well-known port",
                 proto::type_name(p.type), p.seq, from.to_string().c_str());
        wk_.send_to(from, proto::make_text(PacketType::Error, proto::R_PROTOCOL_VIOLATION, p.seq));
        return;
    }
    accept_command(p, from);
}

void Responder::accept_command(const proto::Packet &p, const transport::Endpoint &from)
{
    // repeated COMMAND: same port, same second reply, no new session
    if (auto e = registry_.find(from, p.seq))
    {
        LOG_DEBUG("repeated COMMAND from %s, re-sending port %u", from.to_string().c_str(),
                  (unsigned)e->port);
        wk_.send_to(from, proto::make_redirect(p.seq, e->port));
        if (auto r = registry_.ready_reply(e->port))
            e->channel->send(*r);
        return;
    }

    if (registry_.size() >= opts_.max_sessions)
    {
        LOG_WARN("refusing %s: %zu sessions active", from.to_string().c_str(),
                 opts_.max_sessions);
        wk_.send_to(from, proto::make_text(PacketType::Error, proto::R_NO_RESOURCES, p.seq));
        return;
    }

    auto tx = factory_ ? factory_() : nullptr;
    if (!tx)
    {
        wk_.send_to(from, proto::make_text(PacketType::Error, proto::R_NO_RESOURCES, p.seq));
        return;
    }
    auto ch = std::make_shared<Channel>(std::move(tx));
    ch->set_peer(from);

    transport::Settings s{};
    s.bind_host = opts_.bind_host;
    s.bind_port = 0;
    if (!ch->start(s))
    {
        LOG_ERROR("cannot allocate a dedicated port for %s", from.to_string().c_str());
        wk_.send_to(from, proto::make_text(PacketType::Error, proto::R_NO_RESOURCES, p.seq));
        return;
    }

    auto e          = std::make_shared<SessionEntry>();
    e->client       = from;
    e->nonce        = p.seq;
    e->port         = ch->local().port;
    e->command_text = proto::payload_text(p);
    e->channel      = ch;
    if (!registry_.add(e))
    {
        LOG_ERROR("port %u already registered", (unsigned)e->port);
        ch->stop();
        return;
    }

    LOG_INFO("session %s -> port %u: '%s'", from.to_string().c_str(), (unsigned)e->port,
             e->command_text.c_str());
    wk_.send_to(from, proto::make_redirect(p.seq, e->port));
    e->worker = std::thread([this, e] { run_session(e); });
}

void Responder::run_session(std::shared_ptr<SessionEntry> e)
{
    std::string reason;
    const bool  ok = check_ ? check_(e->command_text, reason) : true;

    if (ok)
    {
        bool announced = false;
        auto ready     = [this, &e, &announced] {
            if (announced)
                return;
            announced    = true;
            auto reply   = proto::make_text(PacketType::Ok, "OK", e->nonce);
            registry_.set_ready_reply(e->port, reply);
            e->channel->send(reply);
        };
        handler_(*e->channel, e->command_text, ready);
        if (!announced)
            LOG_WARN("session on port %u ended without becoming ready", (unsigned)e->port);
    }
    else
    {
        LOG_WARN("command '%s' from %s refused: %s", e->command_text.c_str(),
                 e->client.to_string().c_str(), reason.c_str());
        auto reply = proto::make_text(PacketType::Error, reason, e->nonce);
        registry_.set_ready_reply(e->port, reply);
        e->channel->send(reply);
    }

    e->channel->set_handler(nullptr);
    e->channel->stop();
    LOG_DEBUG("session on port %u finished", (unsigned)e->port);
    e->done.store(true);
}

}  // namespace session
