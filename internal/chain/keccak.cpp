#include "keccak.hpp"

#include <cstring>

namespace mintgate::chain {

namespace {

constexpr std::size_t kRateBytes = 136; // 1088-bit rate for 256-bit output
constexpr int         kRounds    = 24;

constexpr std::uint64_t kRoundConstants[kRounds] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL, 0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL, 0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL, 0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL, 0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL};

// Rho rotation amounts and Pi lane order, walked along the (1,0) lane cycle.
constexpr int kRotation[24] = {1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14, 27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44};
constexpr int kPiLane[24]   = {10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4, 15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1};

inline std::uint64_t Rotl64(std::uint64_t x, int n) {
  return (x << n) | (x >> (64 - n));
}

void KeccakF1600(std::uint64_t state[25]) {
  std::uint64_t bc[5];
  for (int round = 0; round < kRounds; ++round) {
    // Theta
    for (int i = 0; i < 5; ++i) {
      bc[i] = state[i] ^ state[i + 5] ^ state[i + 10] ^ state[i + 15] ^ state[i + 20];
    }
    for (int i = 0; i < 5; ++i) {
      const std::uint64_t t = bc[(i + 4) % 5] ^ Rotl64(bc[(i + 1) % 5], 1);
      for (int j = 0; j < 25; j += 5) {
        state[j + i] ^= t;
      }
    }

    // Rho + Pi
    std::uint64_t t = state[1];
    for (int i = 0; i < 24; ++i) {
      const int lane = kPiLane[i];
      bc[0]          = state[lane];
      state[lane]    = Rotl64(t, kRotation[i]);
      t              = bc[0];
    }

    // Chi
    for (int j = 0; j < 25; j += 5) {
      for (int i = 0; i < 5; ++i) {
        bc[i] = state[j + i];
      }
      for (int i = 0; i < 5; ++i) {
        state[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
      }
    }

    // Iota
    state[0] ^= kRoundConstants[round];
  }
}

void AbsorbBlock(std::uint64_t state[25], const std::uint8_t* block) {
  for (std::size_t lane = 0; lane < kRateBytes / 8; ++lane) {
    std::uint64_t value = 0;
    for (int b = 7; b >= 0; --b) {
      value = (value << 8) | block[lane * 8 + static_cast<std::size_t>(b)];
    }
    state[lane] ^= value;
  }
}

} // namespace

Hash256 Keccak256(const std::uint8_t* data, std::size_t size) {
  std::uint64_t state[25] = {};

  while (size >= kRateBytes) {
    AbsorbBlock(state, data);
    KeccakF1600(state);
    data += kRateBytes;
    size -= kRateBytes;
  }

  std::uint8_t last[kRateBytes] = {};
  if (size > 0) {
    std::memcpy(last, data, size);
  }
  last[size] ^= 0x01;
  last[kRateBytes - 1] ^= 0x80;
  AbsorbBlock(state, last);
  KeccakF1600(state);

  Hash256 out{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<std::uint8_t>(state[i / 8] >> (8 * (i % 8)));
  }
  return out;
}

Hash256 Keccak256(const util::Bytes& data) {
  return Keccak256(data.data(), data.size());
}

Hash256 Keccak256(std::string_view text) {
  return Keccak256(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

} // namespace mintgate::chain
