#include "convert/transform.hpp"
#include "util/log.hpp"

namespace convert
{

bool split_mode(const std::string &mode, std::string &src, std::string &dst)
{
    auto pos = mode.find(':');
    if (pos == std::string::npos || pos == 0 || pos + 1 >= mode.size())
        return false;
    src = mode.substr(0, pos);
    dst = mode.substr(pos + 1);
    return true;
}

void TransformRegistry::add(const std::string &src, const std::string &dst,
                            std::unique_ptr<ITransform> t)
{
    map_[{src, dst}] = std::shared_ptr<ITransform>(std::move(t));
}

bool TransformRegistry::supports(const std::string &src, const std::string &dst) const
{
    return map_.count({src, dst}) != 0;
}

bool TransformRegistry::run(const std::string &mode, const std::string &filename,
                            const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out,
                            std::string &err) const
{
    std::string src, dst;
    if (!split_mode(mode, src, dst))
    {
        err = "bad mode '" + mode + "'";
        return false;
    }
    auto it = map_.find({src, dst});
    if (it == map_.end())
    {
        err = "unsupported conversion " + src + " -> " + dst;
        return false;
    }
    if (!it->second->run(filename, in, out, err))
        return false;
    if (out.empty())
    {
        err = "transform produced no output";
        return false;
    }
    LOG_DEBUG("%s: %zu -> %zu bytes", mode.c_str(), in.size(), out.size());
    return true;
}

std::vector<std::pair<std::string, std::string>> TransformRegistry::pairs() const
{
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto &kv : map_)
        out.push_back(kv.first);
    return out;
}

TransformRegistry TransformRegistry::with_builtins()
{
    TransformRegistry r;
    r.add("txt", "pdf", std::make_unique<TxtToPdf>());
    return r;
}

}  // namespace convert
