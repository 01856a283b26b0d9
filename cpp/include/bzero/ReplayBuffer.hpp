#pragma once

#include "bzero/GameRecord.hpp"
#include "bzero/TrainingTypes.hpp"

#include <cstdint>
#include <deque>
#include <mutex>
#include <random>

namespace bzero {

/*
 * Bounded FIFO store of finished games.
 *
 * Once capacity games are held, each insert evicts the oldest game. sample() draws games with
 * replacement, each with probability proportional to its number of moves, and builds one
 * TrainingExample per draw via TargetBuilder.
 *
 * All methods are thread-safe. A single mutex guards insertion, sampling and the prng.
 */
class ReplayBuffer {
 public:
  // Throws ConfigError if capacity <= 0. The prng is seeded from util::Random::default_prng().
  explicit ReplayBuffer(int capacity);

  void insert(GameRecord::sptr game);

  // Throws InvalidStateError if batch_size is outside [1, TrainingBatch::kMaxSize] or if the
  // buffer is empty.
  TrainingBatch sample(int batch_size);

  int size() const;
  int capacity() const { return capacity_; }
  int64_t total_moves() const;

 private:
  const int capacity_;

  mutable std::mutex mutex_;
  std::deque<GameRecord::sptr> games_;
  std::mt19937 prng_;
  int64_t total_moves_ = 0;
};

}  // namespace bzero
