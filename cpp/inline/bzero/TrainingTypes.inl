#include "bzero/TrainingTypes.hpp"

#include "util/Asserts.hpp"

#include <algorithm>

namespace bzero {

inline TrainingBatch::TrainingBatch(int size)
    : size_(size),
      states_(offset(size, kStateSize)),
      policies_(offset(size, kPolicySize)),
      values_(offset(size, kValueSize)) {}

inline void TrainingBatch::set(int row, const TrainingExample& example) {
  DEBUG_ASSERT(row >= 0 && row < size_, "row={} size={}", row, size_);
  std::copy_n(example.state.data(), kStateSize, states_.data() + offset(row, kStateSize));
  std::copy_n(example.policy.data(), kPolicySize, policies_.data() + offset(row, kPolicySize));
  std::copy_n(example.value.data(), kValueSize, values_.data() + offset(row, kValueSize));
}

}  // namespace bzero
