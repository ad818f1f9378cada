#pragma once
#include <cstdint>
#include <optional>
#include <vector>

#include "proto/packet.hpp"
#include "util/constants.hpp"
#include "util/errors.hpp"

namespace proto
{

// Largest buffer a Reassembler will open: one chunk per MAX_PAYLOAD of the largest accepted file.
inline constexpr std::uint32_t MAX_CHUNKS =
    static_cast<std::uint32_t>(constants::MAX_FILE_BYTES / MAX_PAYLOAD);

// Collects the DATA chunks of one transfer. Arrival order does not matter; duplicate ids
// overwrite the previous copy. Memory is bounded by total * MAX_PAYLOAD.
class Reassembler
{
  public:
    Reassembler() = default;
    explicit Reassembler(std::uint32_t total) { (void)reset(total); }

    // Opens the buffer for `total` chunks. A total above MAX_CHUNKS leaves it closed and
    // returns false.
    bool reset(std::uint32_t total);

    // Ok, OutOfRange (buffer not opened, seq >= total, oversized chunk) or ProtocolViolation
    // (total differs from the one this buffer was opened with).
    udpconv::Error accept(std::uint32_t seq, std::uint32_t total,
                          const std::vector<std::uint8_t> &payload);

    bool is_complete() const { return total_ > 0 && received_ == total_; }
    bool has(std::uint32_t seq) const { return seq < total_ && have_[seq]; }

    std::optional<std::vector<std::uint8_t>> assemble(udpconv::Error *err = nullptr) const;

    std::uint32_t total() const { return total_; }
    std::uint32_t received() const { return received_; }
    std::size_t   bytes() const { return bytes_; }

  private:
    std::uint32_t                          total_    = 0;
    std::uint32_t                          received_ = 0;
    std::size_t                            bytes_    = 0;
    std::vector<std::vector<std::uint8_t>> parts_;  // size == total
    std::vector<bool>                      have_;   // size == total
};

}  // namespace proto
