// tests/test_session.cpp
#include <atomic>
#include <future>
#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "proto/control.hpp"
#include "session/channel.hpp"
#include "session/initiator.hpp"
#include "session/responder.hpp"
#include "test_support.hpp"
#include "transport/loopback_transport.hpp"
#include "xfer/receiver.hpp"
#include "xfer/sender.hpp"

using namespace proto;
using namespace session;
using namespace testsupport;
using namespace std::chrono_literals;
using transport::Endpoint;
using transport::LoopbackHub;
using transport::LoopbackTransport;
using udpconv::Error;

namespace
{
constexpr std::uint16_t WK_PORT = 5051;

bool txt_to_pdf_only(const std::string &text, std::string &reason)
{
    Command c;
    if (!parse_command(text, c, reason))
        return false;
    if (c.src != "txt" || c.dst != "pdf")
    {
        reason = std::string(R_UNSUPPORTED);
        return false;
    }
    return true;
}

transport::TransportFactory loopback_factory(LoopbackHub &hub)
{
    return [&hub] { return std::make_unique<LoopbackTransport>(hub); };
}

transport::Settings wk_settings()
{
    transport::Settings s{};
    s.bind_port = WK_PORT;
    return s;
}

// Client side of one handshake on its own loopback port.
struct Client
{
    Channel   ch;
    Initiator hs;

    Client(LoopbackHub &hub, xfer::RetryPolicy policy)
        : ch(std::make_unique<LoopbackTransport>(hub)), hs(ch, policy)
    {
        ch.set_handler([this](const Packet &p, const Endpoint &from) { hs.on_packet(p, from); });
        ch.start(transport::Settings{});
    }
    ~Client()
    {
        ch.set_handler(nullptr);
        ch.stop();
    }
};

}  // namespace

TEST(Session, HandshakeHandsOutDedicatedPort)
{
    LoopbackHub        hub;
    std::promise<void> release;
    auto               released = release.get_future().share();
    std::atomic<int>   sessions{0};

    Responder resp(std::make_unique<LoopbackTransport>(hub), loopback_factory(hub),
                   txt_to_pdf_only,
                   [&](Channel &, const std::string &text, const std::function<void()> &ready) {
                       EXPECT_EQ(text, "CONVERT txt pdf a.txt");
                       sessions++;
                       ready();
                       released.wait_for(3s);
                   });
    ASSERT_TRUE(resp.start(wk_settings()));

    Client c(hub, fast_policy());
    Error  err       = Error::Decode;
    auto   dedicated = c.hs.establish(resp.local(), "CONVERT txt pdf a.txt", &err);
    ASSERT_TRUE(dedicated.has_value());
    EXPECT_EQ(err, Error::Ok);
    EXPECT_NE(dedicated->port, WK_PORT);
    EXPECT_EQ(dedicated->host, LoopbackHub::HOST);
    EXPECT_EQ(resp.active_sessions(), 1u);
    EXPECT_EQ(resp.registry().ports(), std::vector<std::uint16_t>{dedicated->port});
    auto entry = resp.registry().by_port(dedicated->port);
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->command_text, "CONVERT txt pdf a.txt");
    EXPECT_EQ(entry->nonce, c.hs.nonce());
    EXPECT_EQ(entry->client, c.ch.local());

    release.set_value();
    resp.stop();
    EXPECT_EQ(sessions.load(), 1);
}

TEST(Session, RefusedCommandCarriesReason)
{
    LoopbackHub      hub;
    std::atomic<int> handled{0};
    Responder resp(std::make_unique<LoopbackTransport>(hub), loopback_factory(hub),
                   txt_to_pdf_only,
                   [&](Channel &, const std::string &, const std::function<void()> &ready) {
                       handled++;
                       ready();
                   });
    ASSERT_TRUE(resp.start(wk_settings()));

    {
        Client c(hub, fast_policy());
        Error  err = Error::Ok;
        EXPECT_FALSE(c.hs.establish(resp.local(), "CONVERT png pdf a.png", &err).has_value());
        EXPECT_EQ(err, Error::PeerRejected);
        EXPECT_EQ(c.hs.reason(), "unsupported_format");
    }
    {
        Client c(hub, fast_policy());
        Error  err = Error::Ok;
        EXPECT_FALSE(c.hs.establish(resp.local(), "RESIZE a", &err).has_value());
        EXPECT_EQ(err, Error::PeerRejected);
        EXPECT_EQ(c.hs.reason(), "invalid_command");
    }
    resp.stop();
    EXPECT_EQ(handled.load(), 0);
}

TEST(Session, TransferPacketsOnWellKnownPortAreRejected)
{
    LoopbackHub hub;
    Responder   resp(std::make_unique<LoopbackTransport>(hub), loopback_factory(hub),
                     txt_to_pdf_only,
                     [](Channel &, const std::string &, const std::function<void()> &ready) {
                       ready();
                   });
    ASSERT_TRUE(resp.start(wk_settings()));

    ScriptedPeer rogue(hub);
    rogue.send(resp.local(), make_packet(PacketType::Data, 0, 1, {1, 2, 3}));
    rogue.send(resp.local(), make_packet(PacketType::Hash, 0, 0, std::vector<std::uint8_t>(32)));

    ASSERT_TRUE(rogue.wait_for(PacketType::Error, 2));
    for (const auto &p : rogue.seen())
        EXPECT_EQ(payload_text(p), "protocol_violation");
    EXPECT_EQ(resp.active_sessions(), 0u);
    resp.stop();
}

TEST(Session, RepeatedCommandReusesSession)
{
    LoopbackHub        hub;
    std::promise<void> release;
    auto               released = release.get_future().share();
    std::atomic<int>   sessions{0};

    Responder resp(std::make_unique<LoopbackTransport>(hub), loopback_factory(hub),
                   txt_to_pdf_only,
                   [&](Channel &, const std::string &, const std::function<void()> &ready) {
                       sessions++;
                       ready();
                       released.wait_for(3s);
                   });
    ASSERT_TRUE(resp.start(wk_settings()));

    ScriptedPeer client(hub);
    Packet       cmd = make_text(PacketType::Command, "CONVERT txt pdf a.txt", 42);
    client.send(resp.local(), cmd);
    ASSERT_TRUE(client.wait_for(PacketType::Ok, 2));  // redirect + ready
    client.send(resp.local(), cmd);
    ASSERT_TRUE(client.wait_for(PacketType::Ok, 4));
    hub.wait_idle();

    std::vector<std::uint16_t> ports;
    int                        ready_replies = 0;
    for (const auto &p : client.seen())
    {
        EXPECT_EQ(p.seq, 42u);
        if (auto port = parse_redirect(p))
            ports.push_back(*port);
        else if (payload_text(p) == "OK")
            ready_replies++;
    }
    ASSERT_EQ(ports.size(), 2u);
    EXPECT_EQ(ports[0], ports[1]);
    EXPECT_EQ(ready_replies, 2);
    EXPECT_EQ(resp.active_sessions(), 1u);
    EXPECT_EQ(sessions.load(), 1);

    // a new nonce is a new negotiation
    client.send(resp.local(), make_text(PacketType::Command, "CONVERT txt pdf a.txt", 43));
    ASSERT_TRUE(client.wait_for(PacketType::Ok, 6));
    EXPECT_EQ(resp.active_sessions(), 2u);

    release.set_value();
    resp.stop();
    EXPECT_EQ(sessions.load(), 2);
}

TEST(Session, LostCommandIsRetransmitted)
{
    LoopbackHub hub;
    Responder   resp(std::make_unique<LoopbackTransport>(hub), loopback_factory(hub),
                     txt_to_pdf_only,
                     [](Channel &, const std::string &, const std::function<void()> &ready) {
                       ready();
                   });
    ASSERT_TRUE(resp.start(wk_settings()));

    std::atomic<int> commands{0};
    hub.set_filter([&](const Endpoint &, const Endpoint &, const transport::Frame &f) {
        auto p = decode(f);
        if (p && p->type == PacketType::Command)
            return commands++ > 0;
        return true;
    });

    Client c(hub, fast_policy(50ms, 3));
    Error  err = Error::Decode;
    EXPECT_TRUE(c.hs.establish(resp.local(), "CONVERT txt pdf a.txt", &err).has_value());
    EXPECT_EQ(err, Error::Ok);
    EXPECT_GE(commands.load(), 2);
    resp.stop();
}

TEST(Session, NoServerTimesOut)
{
    LoopbackHub hub;
    Client      c(hub, fast_policy(30ms, 2));
    Error       err = Error::Ok;
    EXPECT_FALSE(c.hs.establish(Endpoint{LoopbackHub::HOST, WK_PORT}, "CONVERT txt pdf a.txt", &err)
                     .has_value());
    EXPECT_EQ(err, Error::TransferTimeout);
}

TEST(Session, ConcurrentSessionsStayIsolated)
{
    LoopbackHub                                      hub;
    std::mutex                                       mu;
    std::map<std::string, std::vector<std::uint8_t>> got;
    const auto                                       policy = fast_policy();

    Responder resp(
        std::make_unique<LoopbackTransport>(hub), loopback_factory(hub), txt_to_pdf_only,
        [&](Channel &ch, const std::string &, const std::function<void()> &ready) {
            auto           peer = ch.peer();
            xfer::Receiver rx(ch.transport(), *peer,
                              [&](xfer::Delivery &&d, std::string &note) {
                                  std::lock_guard<std::mutex> lk(mu);
                                  got[d.filename] = std::move(d.bytes);
                                  note            = "stored";
                                  return true;
                              },
                              policy);
            ch.set_handler([&rx](const Packet &p, const Endpoint &) { rx.on_packet(p); });
            ready();
            EXPECT_EQ(rx.run(), Error::Ok);
            ch.set_handler(nullptr);
        });
    ASSERT_TRUE(resp.start(wk_settings()));

    // same sizes, so both sessions use the same sequence ids at the same time
    auto run_client = [&](const std::string &name, std::uint8_t seed) -> Error {
        Client c(hub, policy);
        Error  err       = Error::Ok;
        auto   dedicated = c.hs.establish(resp.local(), "CONVERT txt pdf " + name, &err);
        if (!dedicated)
            return err;
        c.ch.set_peer(*dedicated);
        xfer::Sender tx(c.ch.transport(), *dedicated, policy);
        c.ch.set_handler([&tx](const Packet &p, const Endpoint &) { tx.on_packet(p); });
        err = tx.send(name, "txt:pdf", pattern(6000, seed));
        c.ch.set_handler(nullptr);
        return err;
    };

    auto a = std::async(std::launch::async, run_client, "a.txt", 0x11);
    auto b = std::async(std::launch::async, run_client, "b.txt", 0x77);
    EXPECT_EQ(a.get(), Error::Ok);
    EXPECT_EQ(b.get(), Error::Ok);
    resp.stop();

    std::lock_guard<std::mutex> lk(mu);
    ASSERT_EQ(got.size(), 2u);
    EXPECT_EQ(got["a.txt"], pattern(6000, 0x11));
    EXPECT_EQ(got["b.txt"], pattern(6000, 0x77));
}
