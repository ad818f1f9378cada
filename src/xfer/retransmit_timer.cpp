#include "xfer/retransmit_timer.hpp"

namespace xfer
{

RetransmitTimer::RetransmitTimer()
{
    thr_ = std::thread([this] { run(); });
}

RetransmitTimer::~RetransmitTimer()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_  = true;
        armed_ = false;
        cb_    = nullptr;
    }
    cv_.notify_all();
    if (thr_.joinable())
        thr_.join();
}

void RetransmitTimer::arm(std::chrono::milliseconds duration, OnExpire on_expire)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        ++generation_;
        deadline_ = Clock::now() + duration;
        cb_       = std::move(on_expire);
        armed_    = true;
    }
    cv_.notify_all();
}

void RetransmitTimer::cancel()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!armed_)
            return;
        ++generation_;
        armed_ = false;
        cb_    = nullptr;
    }
    cv_.notify_all();
}

bool RetransmitTimer::armed() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return armed_;
}

std::uint64_t RetransmitTimer::fired() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return fired_;
}

void RetransmitTimer::run()
{
    std::unique_lock<std::mutex> lk(mu_);
    while (!stop_)
    {
        if (!armed_)
        {
            cv_.wait(lk, [this] { return stop_ || armed_; });
            continue;
        }

        const std::uint64_t gen = generation_;
        if (cv_.wait_until(lk, deadline_, [this, gen] { return stop_ || generation_ != gen; }))
            continue;  // stopped, re-armed or cancelled

        OnExpire cb = std::move(cb_);
        cb_         = nullptr;
        armed_      = false;
        ++fired_;
        lk.unlock();
        if (cb)
            cb();
        lk.lock();
    }
}

}  // namespace xfer
