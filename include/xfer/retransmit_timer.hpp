#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace xfer
{

// One-shot deadline for the packet in flight. arm() replaces any pending deadline; cancel() is
// idempotent. A callback whose arming was cancelled or replaced before it started never runs.
// The callback runs on the timer's own thread without any timer lock held, so it may call
// arm() or cancel() again. cancel() does not wait for a callback that has already started: it
// can still be running, or about to run, when cancel() returns. Owners that must ignore such a
// late call tag each arming and check the tag inside the callback.
class RetransmitTimer
{
  public:
    using Clock    = std::chrono::steady_clock;
    using OnExpire = std::function<void()>;

    RetransmitTimer();
    ~RetransmitTimer();

    RetransmitTimer(const RetransmitTimer &)            = delete;
    RetransmitTimer &operator=(const RetransmitTimer &) = delete;

    void arm(std::chrono::milliseconds duration, OnExpire on_expire);
    void cancel();

    bool          armed() const;
    std::uint64_t fired() const;

  private:
    void run();

    mutable std::mutex      mu_;
    std::condition_variable cv_;
    OnExpire                cb_{};
    Clock::time_point       deadline_{};
    std::uint64_t           generation_{0};
    std::uint64_t           fired_{0};
    bool                    armed_{false};
    bool                    stop_{false};
    std::thread             thr_;
};

}  // namespace xfer
