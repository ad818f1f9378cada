#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace convert
{

// Content transformation behind the transport: verified bytes in, output bytes out.
class ITransform
{
  public:
    virtual ~ITransform() = default;

    virtual bool run(const std::string &filename, const std::vector<std::uint8_t> &in,
                     std::vector<std::uint8_t> &out, std::string &err) = 0;
};

// Plain text -> single-font PDF 1.4 document (Helvetica 11pt, US Letter, wrapped lines).
class TxtToPdf : public ITransform
{
  public:
    bool run(const std::string &filename, const std::vector<std::uint8_t> &in,
             std::vector<std::uint8_t> &out, std::string &err) override;

    static constexpr std::size_t WRAP_COLUMNS   = 90;
    static constexpr std::size_t LINES_PER_PAGE = 54;
};

class TransformRegistry
{
  public:
    void add(const std::string &src, const std::string &dst, std::unique_ptr<ITransform> t);
    bool supports(const std::string &src, const std::string &dst) const;

    // mode is "<src>:<dst>"
    bool run(const std::string &mode, const std::string &filename,
             const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out,
             std::string &err) const;

    std::vector<std::pair<std::string, std::string>> pairs() const;

    static TransformRegistry with_builtins();

  private:
    std::map<std::pair<std::string, std::string>, std::shared_ptr<ITransform>> map_;
};

bool split_mode(const std::string &mode, std::string &src, std::string &dst);

}  // namespace convert
