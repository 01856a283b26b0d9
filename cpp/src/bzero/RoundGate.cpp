#include "bzero/RoundGate.hpp"

#include "bzero/Exceptions.hpp"
#include "util/LoggingUtil.hpp"

#include <magic_enum/magic_enum.hpp>

namespace bzero {

RoundGate::RoundGate(const Params& params, TrainingCoordinator& coordinator)
    : params_(params), coordinator_(coordinator) {
  if (params.games_per_round <= 0) {
    throw ConfigError("Invalid games per round: {}", params.games_per_round);
  }
  if (params.training_steps <= 0) {
    throw ConfigError("Invalid training steps: {}", params.training_steps);
  }
}

bool RoundGate::notify_save() {
  {
    std::unique_lock lock(mutex_);
    ++pending_;
    if (pending_ < params_.games_per_round) {
      LOG_DEBUG("RoundGate: {}/{} games toward round {}", pending_, params_.games_per_round,
                coordinator_.round());
      return false;
    }
    pending_ = 0;

    if (budget_exhausted()) {
      LOG_INFO("RoundGate: quota reached but training budget of {} rounds is exhausted",
               params_.training_rounds);
      return false;
    }
    ++trainings_in_flight_;
  }

  LOG_INFO("RoundGate: quota of {} games reached, state={}", params_.games_per_round,
           magic_enum::enum_name(state()));

  struct Guard {
    RoundGate* gate;
    ~Guard() { gate->finish_training(); }
  } guard{this};

  coordinator_.train(params_.training_steps);
  return true;
}

RoundGate::State RoundGate::state() const {
  std::unique_lock lock(mutex_);
  return trainings_in_flight_ > 0 ? kTraining : kAccumulating;
}

int RoundGate::pending() const {
  std::unique_lock lock(mutex_);
  return pending_;
}

// Called with mutex_ held. Counts trainings already triggered but not yet finished, so that a
// second quota reached mid-training cannot overshoot the budget.
bool RoundGate::budget_exhausted() const {
  if (params_.training_rounds <= 0) return false;
  return coordinator_.round() + trainings_in_flight_ >= params_.training_rounds;
}

void RoundGate::finish_training() {
  std::unique_lock lock(mutex_);
  --trainings_in_flight_;
}

}  // namespace bzero
