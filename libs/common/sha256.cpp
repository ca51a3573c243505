/**
 * @file sha256.cpp
 * @brief SHA-256 (FIPS 180-4) over canonical byte strings, no external dependency
 */

#include "canonjson/common.hpp"

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace canonjson::common {

namespace {

constexpr std::size_t kBlockSize = 64;
constexpr std::size_t kDigestSize = 32;

using Block = std::span<const std::uint8_t, kBlockSize>;
using Digest = std::array<std::uint8_t, kDigestSize>;

constexpr std::array<std::uint32_t, 64> kRoundConstants = {{
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2,
}};

constexpr std::array<std::uint32_t, 8> kInitialState = {{
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a, 0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19,
}};

[[nodiscard]] constexpr std::uint32_t big_sigma0(std::uint32_t x) noexcept
{
    return std::rotr(x, 2) ^ std::rotr(x, 13) ^ std::rotr(x, 22);
}

[[nodiscard]] constexpr std::uint32_t big_sigma1(std::uint32_t x) noexcept
{
    return std::rotr(x, 6) ^ std::rotr(x, 11) ^ std::rotr(x, 25);
}

[[nodiscard]] constexpr std::uint32_t small_sigma0(std::uint32_t x) noexcept
{
    return std::rotr(x, 7) ^ std::rotr(x, 18) ^ (x >> 3U);
}

[[nodiscard]] constexpr std::uint32_t small_sigma1(std::uint32_t x) noexcept
{
    return std::rotr(x, 17) ^ std::rotr(x, 19) ^ (x >> 10U);
}

[[nodiscard]] constexpr std::uint32_t load_be32(const std::uint8_t* p) noexcept
{
    return (static_cast<std::uint32_t>(p[0]) << 24U) | (static_cast<std::uint32_t>(p[1]) << 16U)
           | (static_cast<std::uint32_t>(p[2]) << 8U) | static_cast<std::uint32_t>(p[3]);
}

/**
 * @brief Streaming SHA-256 state: feed bytes with update(), read the digest once with finish()
 */
class Sha256
{
public:
    void update(std::string_view data)
    {
        for (char c : data) {
            m_pending[m_pending_len++] = static_cast<std::uint8_t>(c);
            if (m_pending_len == kBlockSize) {
                compress(Block(m_pending));
                m_pending_len = 0;
            }
        }
        m_total_len += data.size();
    }

    [[nodiscard]] Digest finish()
    {
        const std::uint64_t bit_len = static_cast<std::uint64_t>(m_total_len) * 8U;

        m_pending[m_pending_len++] = 0x80;
        if (m_pending_len > kBlockSize - 8) {
            while (m_pending_len < kBlockSize) {
                m_pending[m_pending_len++] = 0;
            }
            compress(Block(m_pending));
            m_pending_len = 0;
        }
        while (m_pending_len < kBlockSize - 8) {
            m_pending[m_pending_len++] = 0;
        }
        for (int shift = 56; shift >= 0; shift -= 8) {
            m_pending[m_pending_len++] = static_cast<std::uint8_t>(bit_len >> shift);
        }
        compress(Block(m_pending));

        Digest digest{};
        for (std::size_t i = 0; i < m_state.size(); ++i) {
            digest[i * 4] = static_cast<std::uint8_t>(m_state[i] >> 24U);
            digest[i * 4 + 1] = static_cast<std::uint8_t>(m_state[i] >> 16U);
            digest[i * 4 + 2] = static_cast<std::uint8_t>(m_state[i] >> 8U);
            digest[i * 4 + 3] = static_cast<std::uint8_t>(m_state[i]);
        }
        return digest;
    }

private:
    void compress(Block block)
    {
        std::array<std::uint32_t, 64> schedule{};
        for (std::size_t i = 0; i < 16; ++i) {
            schedule[i] = load_be32(block.data() + i * 4);
        }
        for (std::size_t i = 16; i < schedule.size(); ++i) {
            schedule[i] = small_sigma1(schedule[i - 2]) + schedule[i - 7]
                          + small_sigma0(schedule[i - 15]) + schedule[i - 16];
        }

        std::array<std::uint32_t, 8> v = m_state;
        for (std::size_t i = 0; i < schedule.size(); ++i) {
            const std::uint32_t choose = (v[4] & v[5]) ^ (~v[4] & v[6]);
            const std::uint32_t majority = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);
            const std::uint32_t t1 = v[7] + big_sigma1(v[4]) + choose + kRoundConstants[i] + schedule[i];
            const std::uint32_t t2 = big_sigma0(v[0]) + majority;
            v = {t1 + t2, v[0], v[1], v[2], v[3] + t1, v[4], v[5], v[6]};
        }
        for (std::size_t i = 0; i < m_state.size(); ++i) {
            m_state[i] += v[i];
        }
    }

    std::array<std::uint32_t, 8> m_state = kInitialState;
    std::array<std::uint8_t, kBlockSize> m_pending{};
    std::size_t m_pending_len = 0;
    std::size_t m_total_len = 0;
};

[[nodiscard]] std::string to_hex(const Digest& digest)
{
    constexpr std::string_view kHexDigits = "0123456789abcdef";
    std::string hex;
    hex.reserve(digest.size() * 2);
    for (std::uint8_t byte : digest) {
        hex.push_back(kHexDigits[byte >> 4U]);
        hex.push_back(kHexDigits[byte & 0x0FU]);
    }
    return hex;
}

}  // namespace

std::string sha256(std::string_view data)
{
    Sha256 hasher;
    hasher.update(data);
    return to_hex(hasher.finish());
}

std::string sha256_prefixed(std::string_view data)
{
    return "sha256:" + sha256(data);
}

}  // namespace canonjson::common
