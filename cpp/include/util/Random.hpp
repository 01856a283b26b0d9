#pragma once

#include <concepts>
#include <cstdint>
#include <random>
#include <vector>

/*
 * A wrapper around STL's random machinery.
 *
 * default_prng() is seeded with the current time unless set_seed() is called, or unless
 * util::Random::init() is passed a nonzero --seed.
 *
 * default_prng() is not thread-safe. Components that draw random numbers from multiple threads
 * should own a std::mt19937 of their own, seeded via make_prng(), and guard it with their own
 * lock.
 */
namespace util {

class Random {
 public:
  struct Params {
    auto make_options_description();

    int seed = 0;
  };

  static void init(const Params&);

  static void set_seed(int seed);

  /*
   * Returns a new prng whose seed is drawn from default_prng(). After set_seed(), the returned
   * prng's sequence is reproducible.
   */
  static std::mt19937 make_prng();

  /*
   * Uniformly randomly picks a value in the half-open range [lower, upper).
   *
   * Throws util::Exception if lower >= upper.
   */
  template <std::integral T, std::integral U>
  static auto uniform_sample(std::mt19937& prng, T lower, U upper);

  // Returns true with probability 1/2.
  static bool coin_flip(std::mt19937& prng);

  /*
   * Given n nonnegative weights, draws num_samples independent indices on [0, n) (with
   * replacement), where index i is chosen with probability proportional to its weight.
   *
   * std::array<float, 3> arr = {1, 2, 3};
   * std::vector<int> ks = util::Random::weighted_sample_n(prng, arr.begin(), arr.end(), 10);
   */
  template <typename InputIt>
  static std::vector<int> weighted_sample_n(std::mt19937& prng, InputIt begin, InputIt end,
                                            int num_samples);

  static std::mt19937& default_prng();
};

}  // namespace util

#include "inline/util/Random.inl"
