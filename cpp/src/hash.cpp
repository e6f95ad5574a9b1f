// src/hash.cpp
#include "cvm/hash.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace cvm {
namespace {

// ---- Grain LFSR (parameter generation for Poseidon) ----
class GrainLFSR {
public:
  GrainLFSR(std::uint64_t field_bits, std::uint64_t state_len,
            std::uint64_t full_rounds, std::uint64_t partial_rounds)
      : field_bits_(field_bits) {
    std::size_t i = 0;
    auto push = [&](std::uint64_t v, int width) {
      for (int b = width - 1; b >= 0; --b)
        state_[i++] = ((v >> b) & 1u) != 0;
    };
    push(0b01, 2);   // prime field
    push(0b0000, 4); // x^alpha S-box, not the inverse
    push(field_bits, 12);
    push(state_len, 12);
    push(full_rounds, 10);
    push(partial_rounds, 10);
    while (i < state_.size())
      state_[i++] = true;

    for (int k = 0; k < 160; ++k)
      update();
  }

  // Field elements whose bits form a value below p; others are re-drawn.
  std::vector<Field> rejection_sampled(std::size_t n) {
    std::vector<Field> out;
    out.reserve(n);
    mpz_t v;
    mpz_init(v);
    while (out.size() < n) {
      next_integer(v);
      if (mpz_cmp(v, Field::modulus()) < 0)
        out.push_back(Field::from_mpz(v));
    }
    mpz_clear(v);
    return out;
  }

  // Field elements reduced modulo p.
  std::vector<Field> mod_p(std::size_t n) {
    std::vector<Field> out;
    out.reserve(n);
    mpz_t v;
    mpz_init(v);
    for (std::size_t k = 0; k < n; ++k) {
      next_integer(v);
      out.push_back(Field::from_mpz(v));
    }
    mpz_clear(v);
    return out;
  }

private:
  bool bit(std::size_t i) const { return state_[(head_ + i) % 80]; }

  bool update() {
    const bool b = bit(62) ^ bit(51) ^ bit(38) ^ bit(23) ^ bit(13) ^ bit(0);
    state_[head_] = b;
    head_ = (head_ + 1) % 80;
    return b;
  }

  // Self-shrinking output: keep the second bit of each pair whose first bit
  // is set.
  bool next_bit() {
    while (!update())
      update();
    return update();
  }

  // field_bits_ output bits, most significant first.
  void next_integer(mpz_t v) {
    mpz_set_ui(v, 0);
    for (std::uint64_t k = 0; k < field_bits_; ++k) {
      mpz_mul_2exp(v, v, 1);
      if (next_bit())
        mpz_add_ui(v, v, 1);
    }
  }

  std::array<bool, 80> state_{};
  std::size_t head_ = 0;
  std::uint64_t field_bits_;
};

} // namespace

PoseidonParameters derive_poseidon_parameters(std::size_t rate,
                                              std::uint32_t full_rounds,
                                              std::uint32_t partial_rounds,
                                              std::uint64_t alpha) {
  if (rate == 0)
    throw std::invalid_argument("Poseidon rate must be >= 1");
  if (full_rounds % 2 != 0)
    throw std::invalid_argument("Poseidon full rounds must be even");

  PoseidonParameters params;
  params.rate = rate;
  params.capacity = 1;
  params.alpha = alpha;
  params.full_rounds = full_rounds;
  params.partial_rounds = partial_rounds;

  const std::size_t width = rate + params.capacity;
  GrainLFSR lfsr(Field::kModulusBits, width, full_rounds, partial_rounds);

  params.ark.reserve(full_rounds + partial_rounds);
  for (std::uint32_t r = 0; r < full_rounds + partial_rounds; ++r)
    params.ark.push_back(lfsr.rejection_sampled(width));

  const std::vector<Field> xs = lfsr.mod_p(width);
  const std::vector<Field> ys = lfsr.mod_p(width);
  params.mds.assign(width, std::vector<Field>(width));
  for (std::size_t i = 0; i < width; ++i)
    for (std::size_t j = 0; j < width; ++j)
      params.mds[i][j] = (xs[i] + ys[j]).inverse();

  spdlog::debug("derived Poseidon parameters: rate={} alpha={} rounds={}+{}",
                rate, alpha, full_rounds, partial_rounds);
  return params;
}

const PoseidonParameters &poseidon_parameters(std::size_t rate) {
  switch (rate) {
  case 2: {
    static const PoseidonParameters p2 = derive_poseidon_parameters(2, 8, 31, 17);
    return p2;
  }
  case 4: {
    static const PoseidonParameters p4 = derive_poseidon_parameters(4, 8, 31, 17);
    return p4;
  }
  case 8: {
    static const PoseidonParameters p8 = derive_poseidon_parameters(8, 8, 31, 17);
    return p8;
  }
  default:
    throw std::invalid_argument("no Poseidon parameters for rate " +
                                std::to_string(rate));
  }
}

void poseidon_permute(const PoseidonParameters &params,
                      std::vector<Field> &state) {
  const std::size_t width = params.rate + params.capacity;
  if (state.size() != width)
    throw std::invalid_argument("Poseidon state has the wrong width");

  const std::uint32_t half_full = params.full_rounds / 2;
  const std::uint32_t rounds = params.full_rounds + params.partial_rounds;
  std::vector<Field> next(width);

  for (std::uint32_t r = 0; r < rounds; ++r) {
    const bool full_round =
        r < half_full || r >= half_full + params.partial_rounds;

    for (std::size_t i = 0; i < width; ++i)
      state[i] += params.ark[r][i];

    if (full_round) {
      for (Field &x : state)
        x = x.pow(params.alpha);
    } else {
      state[0] = state[0].pow(params.alpha);
    }

    for (std::size_t i = 0; i < width; ++i) {
      Field acc;
      for (std::size_t j = 0; j < width; ++j)
        acc += state[j] * params.mds[i][j];
      next[i] = std::move(acc);
    }
    state.swap(next);
  }
}

Field poseidon_hash(const PoseidonParameters &params,
                    const std::vector<Field> &input) {
  // State layout: [capacity | rate].
  std::vector<Field> state(params.rate + params.capacity);

  // Absorb RATE elements at a time; the permutation after the final chunk is
  // the one that starts squeezing.
  std::size_t offset = 0;
  do {
    const std::size_t end = std::min(offset + params.rate, input.size());
    for (std::size_t k = offset; k < end; ++k)
      state[params.capacity + (k - offset)] += input[k];
    offset = end;
    poseidon_permute(params, state);
  } while (offset < input.size());

  return state[params.capacity];
}

} // namespace cvm
