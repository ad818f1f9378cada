#include "transport/loopback_transport.hpp"
#include "util/log.hpp"

namespace transport
{

LoopbackHub::LoopbackHub()
{
    thr_ = std::thread([this] { run(); });
}

LoopbackHub::~LoopbackHub()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_ = true;
    }
    cv_.notify_all();
    if (thr_.joinable())
        thr_.join();
}

std::uint16_t LoopbackHub::attach(std::uint16_t port, OnDatagram on_rx)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (port == 0)
    {
        while (ports_.count(next_port_) || next_port_ == 0)
            ++next_port_;
        port = next_port_++;
    }
    else if (ports_.count(port))
    {
        return 0;
    }
    ports_[port] = std::make_shared<OnDatagram>(std::move(on_rx));
    return port;
}

void LoopbackHub::detach(std::uint16_t port)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        ports_.erase(port);
    }
    // wait out a callback that may still be running for this port
    if (std::this_thread::get_id() != thr_.get_id())
    {
        std::lock_guard<std::mutex> dlk(dispatch_mu_);
    }
}

bool LoopbackHub::post(const Endpoint &from, const Endpoint &to, const Frame &f)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stop_)
            return false;
        queue_.push_back(Item{from, to, f});
    }
    cv_.notify_one();
    return true;
}

void LoopbackHub::set_filter(Filter f)
{
    std::lock_guard<std::mutex> lk(mu_);
    filter_ = std::move(f);
}

void LoopbackHub::wait_idle()
{
    std::unique_lock<std::mutex> lk(mu_);
    idle_cv_.wait(lk, [this] { return queue_.empty() && !busy_; });
}

void LoopbackHub::run()
{
    for (;;)
    {
        Item                        item;
        std::shared_ptr<OnDatagram> target;
        Filter                      filter;
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait(lk, [this] { return stop_ || !queue_.empty(); });
            if (stop_)
                return;
            item = std::move(queue_.front());
            queue_.pop_front();
            auto it = ports_.find(item.to.port);
            if (it != ports_.end() && item.to.host == HOST)
                target = it->second;
            filter = filter_;
            busy_  = true;
        }

        if (!target)
        {
            LOG_DEBUG("no listener on %s", item.to.to_string().c_str());
            dropped_++;
        }
        else if (filter && !filter(item.from, item.to, item.frame))
        {
            dropped_++;
        }
        else
        {
            std::lock_guard<std::mutex> dlk(dispatch_mu_);
            (*target)(item.frame, item.from);
            delivered_++;
        }

        {
            std::lock_guard<std::mutex> lk(mu_);
            busy_ = false;
            if (queue_.empty())
                idle_cv_.notify_all();
        }
    }
}

// LoopbackTransport: a fake link to exercise the engines without sockets.
bool LoopbackTransport::start(const Settings &s, OnDatagram on_rx)
{
    if (started_.load())
        return false;
    std::uint16_t p = hub_.attach(s.bind_port, std::move(on_rx));
    if (p == 0)
    {
        LOG_ERROR("loopback port %u already in use", (unsigned)s.bind_port);
        return false;
    }
    port_.store(p);
    max_ = s.max_datagram;
    started_.store(true);
    return true;
}

bool LoopbackTransport::send_to(const Endpoint &to, const Frame &datagram)
{
    if (!started_.load())
        return false;
    if (max_ != 0 && datagram.size() > max_)
        return false;
    return hub_.post(local(), to, datagram);
}

void LoopbackTransport::stop()
{
    if (!started_.exchange(false))
        return;
    hub_.detach(port_.load());
}

}  // namespace transport
