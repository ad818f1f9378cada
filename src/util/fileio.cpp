#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include "util/fileio.hpp"
#include "util/log.hpp"

namespace fileio
{
namespace fs = std::filesystem;

bool read_file(const std::string &path, std::vector<std::uint8_t> &out, std::string &err)
{
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
    {
        err = "file '" + path + "' not found";
        return false;
    }
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
    {
        err = "cannot open '" + path + "'";
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    if (ifs.bad())
    {
        err = "read error on '" + path + "'";
        return false;
    }
    return true;
}

bool write_file(const std::string &dir, const std::string &name,
                const std::vector<std::uint8_t> &bytes, std::string &out_path, std::string &err)
{
    std::error_code ec;
    fs::path        d(dir.empty() ? "." : dir);
    if (!fs::exists(d, ec) && !fs::create_directories(d, ec))
    {
        err = "create_directories(" + d.string() + ") failed: " + ec.message();
        LOG_ERROR("%s", err.c_str());
        return false;
    }

    fs::path      p = d / name;
    std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
    if (!ofs)
    {
        err = "cannot create '" + p.string() + "'";
        LOG_ERROR("%s", err.c_str());
        return false;
    }
    ofs.write(reinterpret_cast<const char *>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    ofs.close();
    if (!ofs)
    {
        err = "write error on '" + p.string() + "'";
        LOG_ERROR("%s", err.c_str());
        return false;
    }
    out_path = p.string();
    return true;
}

std::string safe_basename(const std::string &name)
{
    auto        pos  = name.find_last_of("/\\");
    std::string base = (pos == std::string::npos) ? name : name.substr(pos + 1);
    if (base == "." || base == "..")
        return {};
    return base;
}

std::string stem(const std::string &name)
{
    auto pos = name.find_last_of('.');
    if (pos == std::string::npos || pos == 0)
        return name;
    return name.substr(0, pos);
}

}  // namespace fileio
