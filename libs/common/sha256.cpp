/**
 * @file sha256.cpp
 * @brief SHA-256 (FIPS 180-4) used for configuration fingerprints
 */

#include "lintcache/common.hpp"

#include <array>
#include <bit>
#include <cstddef>
#include <cstring>
#include <format>
#include <ranges>
#include <span>

namespace lintcache::common {

namespace {

constexpr std::array<std::uint32_t, 64> kRoundConstants = {
    {0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4,
     0xab1c5ed5, 0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe,
     0x9bdc06a7, 0xc19bf174, 0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f,
     0x4a7484aa, 0x5cb0a9dc, 0x76f988da, 0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
     0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967, 0x27b70a85, 0x2e1b2138, 0x4d2c6dfc,
     0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85, 0xa2bfe8a1, 0xa81a664b,
     0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070, 0x19a4c116,
     0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
     0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7,
     0xc67178f2}
};

constexpr std::array<std::uint32_t, 8> kInitialState = {
    {0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a, 0x510e527f, 0x9b05688c, 0x1f83d9ab,
     0x5be0cd19}
};

constexpr std::size_t kBlockSize = 64uz;

[[nodiscard]] constexpr std::uint32_t load_be32(std::span<const std::uint8_t, 4> bytes) noexcept
{
    return (static_cast<std::uint32_t>(bytes[0]) << 24U)
           | (static_cast<std::uint32_t>(bytes[1]) << 16U)
           | (static_cast<std::uint32_t>(bytes[2]) << 8U) | static_cast<std::uint32_t>(bytes[3]);
}

void compress(std::array<std::uint32_t, 8>& state, std::span<const std::uint8_t, kBlockSize> block)
{
    std::array<std::uint32_t, 64> w{};
    for (auto i : std::views::iota(0uz, 16uz)) {
        w[i] = load_be32(block.subspan(i * 4uz).first<4>());
    }
    for (auto i : std::views::iota(16uz, 64uz)) {
        const std::uint32_t s0 = std::rotr(w[i - 15], 7) ^ std::rotr(w[i - 15], 18) ^ (w[i - 15] >> 3U);
        const std::uint32_t s1 = std::rotr(w[i - 2], 17) ^ std::rotr(w[i - 2], 19) ^ (w[i - 2] >> 10U);
        w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }

    auto v = state;
    for (auto [i, word] : std::views::enumerate(w)) {
        const auto& [a, b, c, d, e, f, g, h] = v;
        const std::uint32_t big_s1 = std::rotr(e, 6) ^ std::rotr(e, 11) ^ std::rotr(e, 25);
        const std::uint32_t choose = (e & f) ^ (~e & g);
        const std::uint32_t t1 =
            h + big_s1 + choose + kRoundConstants[static_cast<std::size_t>(i)] + word;
        const std::uint32_t big_s0 = std::rotr(a, 2) ^ std::rotr(a, 13) ^ std::rotr(a, 22);
        const std::uint32_t majority = (a & b) ^ (a & c) ^ (b & c);
        const std::uint32_t t2 = big_s0 + majority;
        v = {t1 + t2, a, b, c, d + t1, e, f, g};
    }

    for (auto [slot, add] : std::views::zip(state, v)) {
        slot += add;
    }
}

}  // namespace

Sha256Digest sha256_digest(std::string_view data)
{
    auto state = kInitialState;
    const std::span<const std::uint8_t> input(reinterpret_cast<const std::uint8_t*>(data.data()),
                                              data.size());

    const std::size_t full_blocks = input.size() / kBlockSize;
    for (auto i : std::views::iota(0uz, full_blocks)) {
        compress(state, input.subspan(i * kBlockSize).first<kBlockSize>());
    }

    // Tail: remaining bytes, 0x80 marker, zero padding, 64-bit big-endian bit length.
    const auto tail = input.subspan(full_blocks * kBlockSize);
    std::array<std::uint8_t, kBlockSize * 2> padded{};
    std::memcpy(padded.data(), tail.data(), tail.size());
    padded[tail.size()] = 0x80;
    const std::size_t padded_size = (tail.size() + 9uz <= kBlockSize) ? kBlockSize : kBlockSize * 2;

    std::uint64_t bit_length = static_cast<std::uint64_t>(input.size()) * 8U;
    if constexpr (std::endian::native == std::endian::little) {
        bit_length = std::byteswap(bit_length);
    }
    std::memcpy(padded.data() + padded_size - 8uz, &bit_length, sizeof(bit_length));

    const std::span<const std::uint8_t> padded_view(padded.data(), padded_size);
    for (auto offset = 0uz; offset < padded_size; offset += kBlockSize) {
        compress(state, padded_view.subspan(offset).first<kBlockSize>());
    }

    Sha256Digest digest{};
    for (auto [i, word] : std::views::enumerate(state)) {
        const auto idx = static_cast<std::size_t>(i) * 4uz;
        digest[idx + 0uz] = static_cast<std::uint8_t>(word >> 24U);
        digest[idx + 1uz] = static_cast<std::uint8_t>(word >> 16U);
        digest[idx + 2uz] = static_cast<std::uint8_t>(word >> 8U);
        digest[idx + 3uz] = static_cast<std::uint8_t>(word);
    }
    return digest;
}

std::string sha256(std::string_view data)
{
    std::string hex;
    hex.reserve(64);
    for (std::uint8_t byte : sha256_digest(data)) {
        hex += std::format("{:02x}", byte);
    }
    return hex;
}

}  // namespace lintcache::common
