#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "proto/control.hpp"
#include "transport/itransport.hpp"
#include "util/constants.hpp"
#include "util/errors.hpp"
#include "xfer/retry_policy.hpp"

namespace app
{

struct ClientOptions
{
    transport::Endpoint server{std::string(constants::SERVER_HOST), constants::SERVER_PORT};
    std::string         bind_host  = "0.0.0.0";
    std::string         output_dir = std::string(constants::CLIENT_OUTPUT_DIR);
    xfer::RetryPolicy   policy{};
    // Keep the port open this long after the result is stored; zero means one ack_timeout.
    std::chrono::milliseconds linger{0};
};

struct ClientResult
{
    std::string   output_path;  // where the converted file was written
    std::string   output_name;  // name chosen by the server
    std::size_t   bytes{0};
    std::string   reason;       // peer-supplied reason on rejection
};

// One conversion per call: handshake, upload, wait for the converted file, store it.
class ConvertClient
{
  public:
    ConvertClient(ClientOptions opts, transport::TransportFactory factory);

    udpconv::Error convert(const std::string &src, const std::string &dst,
                           const std::string &path, ClientResult &out);

    udpconv::Error convert_bytes(const proto::Command &cmd, const std::vector<std::uint8_t> &bytes,
                                 ClientResult &out);

    const ClientOptions &options() const { return opts_; }

  private:
    ClientOptions               opts_;
    transport::TransportFactory factory_;
};

}  // namespace app
