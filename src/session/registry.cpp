#include "session/registry.hpp"
#include "util/log.hpp"

namespace session
{

bool Registry::add(std::shared_ptr<SessionEntry> e)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (!e || sessions_.count(e->port))
        return false;
    sessions_[e->port] = std::move(e);
    return true;
}

std::shared_ptr<SessionEntry> Registry::find(const transport::Endpoint &client,
                                             std::uint32_t              nonce)
{
    std::lock_guard<std::mutex> lk(mu_);
    for (auto &kv : sessions_)
    {
        if (kv.second->client == client && kv.second->nonce == nonce && !kv.second->done.load())
            return kv.second;
    }
    return nullptr;
}

std::shared_ptr<SessionEntry> Registry::by_port(std::uint16_t port)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(port);
    return it == sessions_.end() ? nullptr : it->second;
}

void Registry::set_ready_reply(std::uint16_t port, const proto::Packet &p)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(port);
    if (it != sessions_.end())
        it->second->ready_reply = p;
}

std::optional<proto::Packet> Registry::ready_reply(std::uint16_t port)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(port);
    if (it == sessions_.end())
        return std::nullopt;
    return it->second->ready_reply;
}

std::size_t Registry::reap()
{
    std::vector<std::shared_ptr<SessionEntry>> finished;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto it = sessions_.begin(); it != sessions_.end();)
        {
            if (it->second->done.load())
            {
                finished.push_back(std::move(it->second));
                it = sessions_.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }
    for (auto &e : finished)
    {
        if (e->worker.joinable())
            e->worker.join();
        LOG_DEBUG("session on port %u reaped", (unsigned)e->port);
    }
    return finished.size();
}

std::size_t Registry::size()
{
    std::lock_guard<std::mutex> lk(mu_);
    std::size_t n = 0;
    for (auto &kv : sessions_)
        n += kv.second->done.load() ? 0 : 1;
    return n;
}

std::vector<std::uint16_t> Registry::ports()
{
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::uint16_t> out;
    for (auto &kv : sessions_)
        out.push_back(kv.first);
    return out;
}

void Registry::join_all()
{
    std::map<std::uint16_t, std::shared_ptr<SessionEntry>> all;
    {
        std::lock_guard<std::mutex> lk(mu_);
        all.swap(sessions_);
    }
    for (auto &kv : all)
    {
        if (kv.second->worker.joinable())
            kv.second->worker.join();
    }
}

}  // namespace session
