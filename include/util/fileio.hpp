#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace fileio
{

bool read_file(const std::string &path, std::vector<std::uint8_t> &out, std::string &err);

// Creates `dir` if needed and writes `name` inside it; `out_path` receives the full path.
bool write_file(const std::string &dir, const std::string &name,
                const std::vector<std::uint8_t> &bytes, std::string &out_path, std::string &err);

// Last path component of a peer-supplied name; empty if nothing usable is left.
std::string safe_basename(const std::string &name);

std::string stem(const std::string &name);

}  // namespace fileio
