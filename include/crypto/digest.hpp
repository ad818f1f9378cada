#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace digest
{

constexpr std::size_t DIGEST_SIZE = 32;  // crypto_hash_sha256_BYTES

using Digest = std::array<std::uint8_t, DIGEST_SIZE>;

// SHA-256 over the whole buffer. False only if libsodium failed to initialise.
bool sha256(const std::uint8_t *data, std::size_t len, Digest &out);
bool sha256(const std::vector<std::uint8_t> &data, Digest &out);

// Constant-time comparison
bool equal(const Digest &a, const Digest &b);

std::optional<Digest> from_bytes(const std::vector<std::uint8_t> &raw);
std::vector<std::uint8_t> to_bytes(const Digest &d);
std::string               to_hex(const Digest &d);

}  // namespace digest
