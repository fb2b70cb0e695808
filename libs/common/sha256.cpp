/**
 * @file sha256.cpp
 * @brief SHA-256 digest used for input digests and stable finding identifiers
 *
 * Self-contained (FIPS 180-4). Operates on whole 64-byte blocks taken straight
 * from the input and only copies the padded tail.
 */

#include "stylint/common.hpp"

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <format>
#include <span>

namespace stylint::common {

namespace {

using Digest = std::array<std::uint32_t, 8>;

constexpr std::array<std::uint32_t, 64> kRoundConstants = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2,
};

constexpr Digest kInitialState = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a, 0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19,
};

[[nodiscard]] constexpr std::uint32_t load_be32(std::span<const std::uint8_t, 4> bytes) noexcept
{
    return (static_cast<std::uint32_t>(bytes[0]) << 24U)
           | (static_cast<std::uint32_t>(bytes[1]) << 16U)
           | (static_cast<std::uint32_t>(bytes[2]) << 8U) | static_cast<std::uint32_t>(bytes[3]);
}

void compress(Digest& state, std::span<const std::uint8_t, 64> block) noexcept
{
    std::array<std::uint32_t, 64> schedule{};
    for (std::size_t i = 0; i < 16; ++i) {
        schedule[i] = load_be32(block.subspan(i * 4).first<4>());
    }
    for (std::size_t i = 16; i < 64; ++i) {
        const std::uint32_t w15 = schedule[i - 15];
        const std::uint32_t w2 = schedule[i - 2];
        const std::uint32_t s0 = std::rotr(w15, 7) ^ std::rotr(w15, 18) ^ (w15 >> 3U);
        const std::uint32_t s1 = std::rotr(w2, 17) ^ std::rotr(w2, 19) ^ (w2 >> 10U);
        schedule[i] = schedule[i - 16] + s0 + schedule[i - 7] + s1;
    }

    Digest work = state;
    for (std::size_t i = 0; i < 64; ++i) {
        const auto& [a, b, c, d, e, f, g, h] = work;
        const std::uint32_t big_s1 = std::rotr(e, 6) ^ std::rotr(e, 11) ^ std::rotr(e, 25);
        const std::uint32_t choose = (e & f) ^ (~e & g);
        const std::uint32_t t1 = h + big_s1 + choose + kRoundConstants[i] + schedule[i];
        const std::uint32_t big_s0 = std::rotr(a, 2) ^ std::rotr(a, 13) ^ std::rotr(a, 22);
        const std::uint32_t majority = (a & b) ^ (a & c) ^ (b & c);
        const std::uint32_t t2 = big_s0 + majority;
        work = Digest{t1 + t2, a, b, c, d + t1, e, f, g};
    }

    for (std::size_t i = 0; i < state.size(); ++i) {
        state[i] += work[i];
    }
}

[[nodiscard]] Digest digest_of(std::string_view data)
{
    Digest state = kInitialState;
    const auto* bytes = reinterpret_cast<const std::uint8_t*>(data.data());
    const std::size_t full_blocks = data.size() / 64;

    for (std::size_t i = 0; i < full_blocks; ++i) {
        compress(state, std::span<const std::uint8_t, 64>(bytes + (i * 64), 64));
    }

    // Tail plus padding: at most two blocks.
    std::array<std::uint8_t, 128> tail{};
    const std::size_t remaining = data.size() - (full_blocks * 64);
    for (std::size_t i = 0; i < remaining; ++i) {
        tail[i] = bytes[(full_blocks * 64) + i];
    }
    tail[remaining] = 0x80;
    const std::size_t tail_len = (remaining + 9 <= 64) ? 64 : 128;
    const std::uint64_t bit_len = static_cast<std::uint64_t>(data.size()) * 8U;
    for (std::size_t i = 0; i < 8; ++i) {
        tail[tail_len - 1 - i] = static_cast<std::uint8_t>(bit_len >> (i * 8U));
    }

    compress(state, std::span<const std::uint8_t, 64>(tail.data(), 64));
    if (tail_len == 128) {
        compress(state, std::span<const std::uint8_t, 64>(tail.data() + 64, 64));
    }
    return state;
}

}  // namespace

std::string sha256(std::string_view data)
{
    std::string hex;
    hex.reserve(64);
    for (std::uint32_t word : digest_of(data)) {
        hex += std::format("{:08x}", word);
    }
    return hex;
}

std::string sha256_prefixed(std::string_view data)
{
    return "sha256:" + sha256(data);
}

}  // namespace stylint::common
