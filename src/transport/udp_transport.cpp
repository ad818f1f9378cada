#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "transport/udp_transport.hpp"
#include "util/log.hpp"

namespace transport
{

static bool to_sockaddr(const Endpoint &ep, sockaddr_in &out)
{
    std::memset(&out, 0, sizeof(out));
    out.sin_family = AF_INET;
    out.sin_port   = htons(ep.port);
    return inet_pton(AF_INET, ep.host.c_str(), &out.sin_addr) == 1;
}

static Endpoint from_sockaddr(const sockaddr_in &in)
{
    char buf[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &in.sin_addr, buf, sizeof(buf));
    return Endpoint{buf, ntohs(in.sin_port)};
}

UdpTransport::~UdpTransport()
{
    stop();
}

bool UdpTransport::start(const Settings &s, OnDatagram on_rx)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (running_.load())
    {
        LOG_WARN("UdpTransport already started on %s", local_.to_string().c_str());
        return false;
    }

    sockaddr_in addr{};
    if (!to_sockaddr(Endpoint{s.bind_host, s.bind_port}, addr))
    {
        LOG_ERROR("invalid bind address: %s", s.bind_host.c_str());
        return false;
    }

    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }

    int fd_flags = fcntl(fd, F_GETFD, 0);
    if (fd_flags != -1)
        fcntl(fd, F_SETFD, fd_flags | FD_CLOEXEC);

    if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == -1)
    {
        int saved = errno;
        ::close(fd);
        errno = saved;
        LOG_ERROR("bind(%s:%u) failed: %s", s.bind_host.c_str(), (unsigned)s.bind_port,
                  std::strerror(errno));
        return false;
    }

    sockaddr_in bound{};
    socklen_t   blen = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr *>(&bound), &blen) == -1)
    {
        int saved = errno;
        ::close(fd);
        errno = saved;
        LOG_ERROR("getsockname() failed: %s", std::strerror(errno));
        return false;
    }

    fd_       = fd;
    settings_ = s;
    on_rx_    = std::move(on_rx);
    local_    = from_sockaddr(bound);
    running_.store(true);
    rx_thr_ = std::thread([this, fd] { rx_loop(fd); });

    LOG_DEBUG("UDP bound on %s", local_.to_string().c_str());
    return true;
}

void UdpTransport::rx_loop(int fd)
{
    std::vector<std::uint8_t> buf(settings_.max_datagram + 1);
    while (running_.load())
    {
        pollfd pfd{};
        pfd.fd     = fd;
        pfd.events = POLLIN;
        int rc     = ::poll(&pfd, 1, 100);
        if (rc == 0)
            continue;
        if (rc == -1)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("poll() failed: %s", std::strerror(errno));
            break;
        }

        sockaddr_in from{};
        socklen_t   flen = sizeof(from);
        ssize_t     n    = ::recvfrom(fd, buf.data(), buf.size(), 0,
                                      reinterpret_cast<sockaddr *>(&from), &flen);
        if (n == -1)
        {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK ||
                errno == ECONNREFUSED)
                continue;
            LOG_ERROR("recvfrom() failed: %s", std::strerror(errno));
            break;
        }
        if (static_cast<std::size_t>(n) > settings_.max_datagram)
        {
            LOG_DEBUG("dropping oversized datagram (%zd bytes)", n);
            continue;
        }
        if (on_rx_)
            on_rx_(Frame(buf.begin(), buf.begin() + n), from_sockaddr(from));
    }
}

bool UdpTransport::send_to(const Endpoint &to, const Frame &datagram)
{
    sockaddr_in addr{};
    if (!to_sockaddr(to, addr))
    {
        LOG_ERROR("send_to: invalid address %s", to.to_string().c_str());
        return false;
    }

    // stop() closes the socket under the same lock
    std::lock_guard<std::mutex> lk(mu_);
    if (!running_.load() || fd_ == -1)
        return false;
    if (datagram.empty() || datagram.size() > settings_.max_datagram)
    {
        LOG_ERROR("send_to: bad datagram size %zu", datagram.size());
        return false;
    }
    for (;;)
    {
        ssize_t n = ::sendto(fd_, datagram.data(), datagram.size(), 0,
                             reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
        if (n >= 0)
            return true;
        if (errno == EINTR)
            continue;
        LOG_WARN("sendto(%s) failed: %s", to.to_string().c_str(), std::strerror(errno));
        return false;
    }
}

void UdpTransport::stop()
{
    std::thread thr;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!running_.exchange(false))
            return;
        thr = std::move(rx_thr_);
    }
    if (thr.joinable())
    {
        if (thr.get_id() == std::this_thread::get_id())
        {
            // called from inside on_rx; the loop exits once the callback returns
            LOG_WARN("UdpTransport::stop called from the receive thread");
            thr.detach();
        }
        else
        {
            thr.join();
        }
    }
    std::lock_guard<std::mutex> lk(mu_);
    ::close(fd_);
    fd_ = -1;
}

// written once in start() before the receive thread exists
Endpoint UdpTransport::local() const
{
    return local_;
}

}  // namespace transport
