#include <algorithm>
#include <sodium.h>

#include "crypto/digest.hpp"
#include "util/log.hpp"

namespace digest
{

static_assert(DIGEST_SIZE == crypto_hash_sha256_BYTES, "digest size mismatch");

static bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

bool sha256(const std::uint8_t *data, std::size_t len, Digest &out)
{
    if (!ensure_sodium_init())
    {
        LOG_ERROR("sodium_init failed");
        return false;
    }
    static const std::uint8_t empty = 0;
    return crypto_hash_sha256(out.data(), data ? data : &empty,
                              static_cast<unsigned long long>(len)) == 0;
}

bool sha256(const std::vector<std::uint8_t> &data, Digest &out)
{
    return sha256(data.data(), data.size(), out);
}

bool equal(const Digest &a, const Digest &b)
{
    ensure_sodium_init();
    return sodium_memcmp(a.data(), b.data(), DIGEST_SIZE) == 0;
}

std::optional<Digest> from_bytes(const std::vector<std::uint8_t> &raw)
{
    if (raw.size() != DIGEST_SIZE)
        return std::nullopt;
    Digest d{};
    std::copy(raw.begin(), raw.end(), d.begin());
    return d;
}

std::vector<std::uint8_t> to_bytes(const Digest &d)
{
    return std::vector<std::uint8_t>(d.begin(), d.end());
}

std::string to_hex(const Digest &d)
{
    char hex[DIGEST_SIZE * 2 + 1];
    sodium_bin2hex(hex, sizeof(hex), d.data(), d.size());
    return std::string(hex);
}

}  // namespace digest
