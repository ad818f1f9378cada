#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "convert/transform.hpp"
#include "session/channel.hpp"
#include "session/responder.hpp"
#include "transport/itransport.hpp"
#include "util/constants.hpp"
#include "xfer/retry_policy.hpp"

namespace app
{

struct ServerOptions
{
    std::string       bind_host  = std::string(constants::BIND_HOST);
    std::uint16_t     port       = constants::SERVER_PORT;  // 0 picks a free port
    std::string       output_dir = std::string(constants::SERVER_OUTPUT_DIR);
    xfer::RetryPolicy policy{};
    std::size_t       max_sessions = 64;
};

/*
Conversion server. Per accepted COMMAND, on the dedicated port:

  upload:   client METADATA/DATA/HASH  -> receiver -> transform -> store -> COMPLETE(name)
  download: sender METADATA/DATA/HASH  -> client, until the client reports COMPLETE

A failed transform is reported with ERROR "conversion_failed" instead of COMPLETE.
*/
class ConvertServer
{
  public:
    ConvertServer(ServerOptions opts, convert::TransformRegistry transforms,
                  transport::TransportFactory factory);
    ~ConvertServer();

    ConvertServer(const ConvertServer &)            = delete;
    ConvertServer &operator=(const ConvertServer &) = delete;

    bool start();
    void stop();

    transport::Endpoint local() const;
    std::size_t         active_sessions();
    std::uint64_t       completed() const { return completed_.load(); }
    std::uint64_t       failed() const { return failed_.load(); }

  private:
    bool check(const std::string &command_text, std::string &reason) const;
    void serve(session::Channel &ch, const std::string &command_text,
               const std::function<void()> &ready);

    ServerOptions                       opts_;
    convert::TransformRegistry          transforms_;
    transport::TransportFactory         factory_;
    std::unique_ptr<session::Responder> responder_;
    std::atomic<std::uint64_t>          completed_{0};
    std::atomic<std::uint64_t>          failed_{0};
};

// "<stem>_<8 hex>.<dst>"
std::string output_name(const std::string &filename, const std::string &dst);

}  // namespace app
