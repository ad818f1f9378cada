#include <cstdio>
#include <cstdlib>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "app/convert_client.hpp"
#include "transport/udp_transport.hpp"
#include "util/config.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"
#include "xfer/retry_policy.hpp"

namespace
{

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  udpconv [--host <ip>] [--port <n>] [--out <dir>] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  convert <src> <dst> <file>   e.g. convert txt pdf notes.txt\n"
                         "  help\n");
}

static int do_convert(const config::Config &cfg, const std::vector<std::string> &args)
{
    if (args.size() != 4)
    {
        print_usage();
        return exitc::bad_args;
    }

    app::ClientOptions opts;
    opts.server     = transport::Endpoint{cfg.host, cfg.port};
    opts.output_dir = cfg.output_dir;
    opts.policy     = xfer::RetryPolicy::from_config(cfg);

    app::ConvertClient client(std::move(opts),
                              [] { return std::make_unique<transport::UdpTransport>(); });

    app::ClientResult res;
    udpconv::Error    e = client.convert(args[1], args[2], args[3], res);
    if (e != udpconv::Error::Ok)
    {
        std::fprintf(stderr, "error: %s%s%s\n", udpconv::error_name(e),
                     res.reason.empty() ? "" : ": ", res.reason.c_str());
        return exitc::from_error(e);
    }
    std::printf("%s\n", res.output_path.c_str());
    return exitc::ok;
}

static int run_cmd(const config::Config &cfg, const std::string &cmd,
                   const std::vector<std::string> &args)
{
    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"convert", [&]() -> int { return do_convert(cfg, args); }},
        {"help",
         [&]() -> int {
             print_usage();
             return exitc::ok;
         }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    udpconv::set_log_level_by_name(std::getenv("UDPCONV_LOG_LEVEL"));

    // Environment first, then CLI flags override
    config::Config cfg = config::load_from_env(config::Role::Client);

    std::vector<std::string> args;
    args.reserve(argc - 1);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--host" && i + 1 < argc)
        {
            cfg.host = argv[++i];
        }
        else if (a == "--port" && i + 1 < argc)
        {
            std::uint32_t v = 0;
            if (!config::parse_u32(argv[++i], 1, 65535, v))
            {
                std::fprintf(stderr, "error: invalid port '%s'\n", argv[i]);
                return exitc::bad_args;
            }
            cfg.port = static_cast<std::uint16_t>(v);
        }
        else if (a == "--out" && i + 1 < argc)
        {
            cfg.output_dir = argv[++i];
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    return run_cmd(cfg, args[0], args);
}
