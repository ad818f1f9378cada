#pragma once
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "proto/packet.hpp"
#include "session/channel.hpp"
#include "transport/itransport.hpp"

namespace session
{

struct SessionEntry
{
    transport::Endpoint          client;
    std::uint32_t                nonce{0};
    std::uint16_t                port{0};
    std::string                  command_text;
    std::shared_ptr<Channel>     channel;
    std::optional<proto::Packet> ready_reply;  // second OK / ERROR, kept for repeats
    std::thread                  worker;
    std::atomic_bool             done{false};  // set by the worker as its very last step
};

// Owned map of dedicated port -> active session. Every access goes through the mutex.
class Registry
{
  public:
    Registry() = default;
    ~Registry() { join_all(); }

    Registry(const Registry &)            = delete;
    Registry &operator=(const Registry &) = delete;

    bool                          add(std::shared_ptr<SessionEntry> e);
    std::shared_ptr<SessionEntry> find(const transport::Endpoint &client, std::uint32_t nonce);
    std::shared_ptr<SessionEntry> by_port(std::uint16_t port);
    void set_ready_reply(std::uint16_t port, const proto::Packet &p);
    std::optional<proto::Packet> ready_reply(std::uint16_t port);

    // join and drop sessions whose worker has finished
    std::size_t reap();
    std::size_t size();
    void        join_all();
    std::vector<std::uint16_t> ports();

  private:
    std::mutex                                             mu_;
    std::map<std::uint16_t, std::shared_ptr<SessionEntry>> sessions_;
};

}  // namespace session
