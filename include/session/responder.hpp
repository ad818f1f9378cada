#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "session/channel.hpp"
#include "session/registry.hpp"
#include "transport/itransport.hpp"

namespace session
{

// Validates the command text before any transfer starts; on false `reason` goes back in ERROR.
using CommandCheck = std::function<bool(const std::string &command_text, std::string &reason)>;

// Runs one accepted transfer on its own worker thread. The channel is pinned to the client;
// the handler installs its own packet routing, calls `ready` (which sends the second OK) and
// returns when the transfer is over.
using SessionHandler = std::function<void(Channel &ch, const std::string &command_text,
                                          const std::function<void()> &ready)>;

struct ResponderOptions
{
    std::string bind_host    = "0.0.0.0";
    std::size_t max_sessions = 64;
};

/*
Server half of the handshake. COMMANDs arrive on the well-known channel; each new one gets a
fresh transport from the factory (its own port and sequence-id space), an OK carrying that
port, and a worker thread. The worker sends the second OK or ERROR from the dedicated port and
then runs the session handler.
*/
class Responder
{
  public:
    Responder(std::unique_ptr<transport::ITransport> well_known,
              transport::TransportFactory            factory,
              CommandCheck                           check,
              SessionHandler                         handler,
              ResponderOptions                       opts = {});
    ~Responder();

    Responder(const Responder &)            = delete;
    Responder &operator=(const Responder &) = delete;

    bool start(const transport::Settings &well_known_settings);
    // Stops accepting and waits for running sessions to finish.
    void stop();

    transport::Endpoint local() const { return wk_.local(); }
    std::size_t         active_sessions() { return registry_.size(); }
    Registry           &registry() { return registry_; }

  private:
    void on_packet(const proto::Packet &p, const transport::Endpoint &from);
    void accept_command(const proto::Packet &p, const transport::Endpoint &from);
    void run_session(std::shared_ptr<SessionEntry> e);

    Channel                     wk_;
    transport::TransportFactory factory_;
    CommandCheck                check_;
    SessionHandler              handler_;
    ResponderOptions            opts_;
    Registry                    registry_;
    std::atomic_bool            accepting_{false};
};

}  // namespace session
