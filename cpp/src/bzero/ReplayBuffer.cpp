#include "bzero/ReplayBuffer.hpp"

#include "bzero/Exceptions.hpp"
#include "bzero/TargetBuilder.hpp"
#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <vector>

namespace bzero {

ReplayBuffer::ReplayBuffer(int capacity) : capacity_(capacity), prng_(util::Random::make_prng()) {
  if (capacity <= 0) {
    throw ConfigError("Invalid replay buffer capacity: {}", capacity);
  }
}

void ReplayBuffer::insert(GameRecord::sptr game) {
  RELEASE_ASSERT(game != nullptr);
  std::unique_lock lock(mutex_);
  if ((int)games_.size() == capacity_) {
    total_moves_ -= games_.front()->num_moves();
    games_.pop_front();
  }
  total_moves_ += game->num_moves();
  games_.push_back(std::move(game));
  LOG_DEBUG("ReplayBuffer::{}() size={} total_moves={}", __func__, games_.size(), total_moves_);
}

TrainingBatch ReplayBuffer::sample(int batch_size) {
  if (batch_size <= 0 || batch_size > TrainingBatch::kMaxSize) {
    throw InvalidStateError("Invalid batch size: {}", batch_size);
  }

  std::unique_lock lock(mutex_);
  if (games_.empty()) {
    throw InvalidStateError("Cannot sample from an empty replay buffer");
  }

  std::vector<int> weights;
  weights.reserve(games_.size());
  for (const auto& game : games_) {
    weights.push_back(game->num_moves());
  }

  std::vector<int> picks =
    util::Random::weighted_sample_n(prng_, weights.begin(), weights.end(), batch_size);

  TrainingBatch batch(batch_size);
  for (int row = 0; row < batch_size; ++row) {
    batch.set(row, TargetBuilder::build(prng_, *games_[picks[row]]));
  }
  return batch;
}

int ReplayBuffer::size() const {
  std::unique_lock lock(mutex_);
  return games_.size();
}

int64_t ReplayBuffer::total_moves() const {
  std::unique_lock lock(mutex_);
  return total_moves_;
}

}  // namespace bzero
