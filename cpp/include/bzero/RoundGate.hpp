#pragma once

#include "bzero/TrainingCoordinator.hpp"

#include <cstdint>
#include <mutex>

namespace bzero {

/*
 * Counts completed games against the per-round quota and triggers exactly one
 * TrainingCoordinator::train() call per quota reached.
 *
 * The increment-compare-reset sequence runs under a mutex, so concurrent notify_save() calls
 * landing on the quota boundary trigger training once, not zero times or twice. Training itself
 * runs on the thread whose notify_save() completed the quota, outside the gate's mutex; concurrent
 * trainings are serialized by the coordinator.
 *
 * The counter is reset when the quota is reached, before training starts. A failed training
 * therefore consumes its quota.
 *
 * If training_rounds > 0, quotas reached once the coordinator's round has hit training_rounds are
 * still counted and reset, but trigger nothing.
 */
class RoundGate {
 public:
  enum State : int8_t { kAccumulating, kTraining };

  struct Params {
    int games_per_round = 1;
    int training_steps = 10;
    int training_rounds = 0;  // 0 means unlimited
  };

  // Throws ConfigError if games_per_round or training_steps is not positive.
  RoundGate(const Params& params, TrainingCoordinator& coordinator);

  /*
   * Records one completed game. Returns true if this call triggered (and completed) a training
   * round. Exceptions from TrainingCoordinator::train() propagate to the caller.
   */
  bool notify_save();

  State state() const;
  int pending() const;
  int games_per_round() const { return params_.games_per_round; }

 private:
  bool budget_exhausted() const;
  void finish_training();

  const Params params_;
  TrainingCoordinator& coordinator_;

  mutable std::mutex mutex_;
  int pending_ = 0;
  int trainings_in_flight_ = 0;
};

}  // namespace bzero
