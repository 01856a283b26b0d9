#pragma once

#include "bzero/BasicTypes.hpp"

#include <cstddef>
#include <vector>

namespace bzero {

// A single (state, policy-target, value-target) triple.
struct TrainingExample {
  BoardTensor state;
  PolicyTensor policy;
  ValueArray value;
};

/*
 * A mini-batch laid out contiguously in row-major order:
 *
 * states: [size, kNumPlanes, kDim, kDim]
 * policies: [size, kNumTiles]
 * values: [size, kNumPlayers]
 *
 * The layout matches torch's, so a predictor can wrap the buffers without copying.
 */
class TrainingBatch {
 public:
  static constexpr int kStateSize = BoardShape::total_size;
  static constexpr int kPolicySize = PolicyShape::total_size;
  static constexpr int kValueSize = kNumPlayers;
  static constexpr int kMaxSize = 16384;

  explicit TrainingBatch(int size);

  int size() const { return size_; }
  void set(int row, const TrainingExample& example);

  const float* states() const { return states_.data(); }
  const float* policies() const { return policies_.data(); }
  const float* values() const { return values_.data(); }

  const float* state(int row) const { return states_.data() + offset(row, kStateSize); }
  const float* policy(int row) const { return policies_.data() + offset(row, kPolicySize); }
  const float* value(int row) const { return values_.data() + offset(row, kValueSize); }

 private:
  static size_t offset(int row, int row_size) { return size_t(row) * row_size; }

  int size_;
  std::vector<float> states_;
  std::vector<float> policies_;
  std::vector<float> values_;
};

struct Prediction {
  PolicyTensor policy;  // raw logits
  ValueArray value;
};

struct Losses {
  float loss = 0;
  float value_loss = 0;
  float policy_loss = 0;
};

}  // namespace bzero

#include "inline/bzero/TrainingTypes.inl"
