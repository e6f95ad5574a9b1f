// include/cvm/hash.hpp
#pragma once
#include "field.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace cvm {

// Round constants and MDS matrix for one Poseidon instance over Field.
struct PoseidonParameters {
  std::size_t rate = 0;
  std::size_t capacity = 1;
  std::uint64_t alpha = 17;
  std::uint32_t full_rounds = 8;
  std::uint32_t partial_rounds = 31;
  std::vector<std::vector<Field>> ark; // [round][state index]
  std::vector<std::vector<Field>> mds; // [row][column]
};

// Derives constants from the Grain LFSR: round constants by rejection
// sampling, MDS as the Cauchy matrix 1 / (x_i + y_j).
PoseidonParameters derive_poseidon_parameters(std::size_t rate,
                                              std::uint32_t full_rounds,
                                              std::uint32_t partial_rounds,
                                              std::uint64_t alpha);

// Cached parameters for rate 2, 4 or 8 (alpha 17, 8 full, 31 partial).
// Throws std::invalid_argument for any other rate.
const PoseidonParameters &poseidon_parameters(std::size_t rate);

// One full permutation of `state` (size rate + capacity), in place.
void poseidon_permute(const PoseidonParameters &params,
                      std::vector<Field> &state);

// Sponge: absorb all of `input`, squeeze one element.
Field poseidon_hash(const PoseidonParameters &params,
                    const std::vector<Field> &input);

// Stateless hash functor with a fixed input rate.
template <std::size_t Rate> struct Poseidon {
  static_assert(Rate == 2 || Rate == 4 || Rate == 8,
                "unsupported Poseidon rate");
  static constexpr std::size_t kRate = Rate;

  Field hash(const std::vector<Field> &input) const {
    return poseidon_hash(poseidon_parameters(Rate), input);
  }
};

using Poseidon2 = Poseidon<2>;
using Poseidon4 = Poseidon<4>;
using Poseidon8 = Poseidon<8>;

} // namespace cvm
