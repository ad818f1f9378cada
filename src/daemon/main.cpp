#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <pthread.h>
#include <string>

#include "app/convert_server.hpp"
#include "convert/transform.hpp"
#include "transport/udp_transport.hpp"
#include "util/config.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"
#include "xfer/retry_policy.hpp"

static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  udpconvd [--bind <ip>] [--port <n>] [--out <dir>]\n"
                         "\n"
                         "Environment:\n"
                         "  UDPCONV_BIND, UDPCONV_PORT, UDPCONV_OUTPUT_DIR,\n"
                         "  UDPCONV_ACK_TIMEOUT_MS, UDPCONV_MAX_RETRIES, UDPCONV_IDLE_TIMEOUT_MS,\n"
                         "  UDPCONV_LOG_LEVEL\n");
}

int main(int argc, char **argv)
{
    // log level from env var
    udpconv::set_log_level_by_name(std::getenv("UDPCONV_LOG_LEVEL"));

    config::Config cfg = config::load_from_env(config::Role::Server);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (i + 1 >= argc)
        {
            std::fprintf(stderr, "error: unknown or incomplete option '%s'\n", a.c_str());
            print_usage();
            return exitc::bad_args;
        }
        if (a == "--bind")
        {
            cfg.bind = argv[++i];
        }
        else if (a == "--port")
        {
            std::uint32_t v = 0;
            if (!config::parse_u32(argv[++i], 0, 65535, v))
            {
                std::fprintf(stderr, "error: invalid port '%s'\n", argv[i]);
                return exitc::bad_args;
            }
            cfg.port = static_cast<std::uint16_t>(v);
        }
        else if (a == "--out")
        {
            cfg.output_dir = argv[++i];
        }
        else
        {
            std::fprintf(stderr, "error: unknown option '%s'\n", a.c_str());
            print_usage();
            return exitc::bad_args;
        }
    }

    LOG_SYSTEM("Config: bind=%s port=%u out=%s ack_timeout=%ums retries=%u idle=%ums",
               cfg.bind.c_str(), (unsigned)cfg.port, cfg.output_dir.c_str(), cfg.ack_timeout_ms,
               cfg.max_retries, cfg.idle_timeout_ms);

    // block before any thread exists so every worker inherits the mask
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

    app::ServerOptions opts;
    opts.bind_host  = cfg.bind;
    opts.port       = cfg.port;
    opts.output_dir = cfg.output_dir;
    opts.policy     = xfer::RetryPolicy::from_config(cfg);

    app::ConvertServer server(std::move(opts), convert::TransformRegistry::with_builtins(),
                              [] { return std::make_unique<transport::UdpTransport>(); });
    if (!server.start())
    {
        LOG_ERROR("server start failed");
        return exitc::io;
    }

    int sig = 0;
    if (sigwait(&sigs, &sig) != 0)
        LOG_ERROR("sigwait failed");
    else
        LOG_SYSTEM("signal %d, shutting down", sig);

    server.stop();
    return exitc::ok;
}
