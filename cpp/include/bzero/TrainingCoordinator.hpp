#pragma once

#include "bzero/BasicTypes.hpp"
#include "bzero/Predictor.hpp"
#include "bzero/ReplayBuffer.hpp"
#include "bzero/TrainingStatsWriter.hpp"
#include "bzero/TrainingTypes.hpp"

#include <boost/filesystem.hpp>

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <vector>

namespace bzero {

/*
 * Owns the model and the round counter.
 *
 * train() holds an exclusive lock on the model for its full loop; predict() takes a shared lock,
 * so inference never observes a model mid-update. round() reads an atomic and never blocks.
 *
 * After each completed train() call, the model is checkpointed to
 * <models_dir>/model_<round>.pt and the round is incremented. Checkpoints are never pruned or
 * overwritten: the first round is initial_round, or one past the newest checkpoint already in
 * models_dir if that is later.
 */
class TrainingCoordinator {
 public:
  struct Params {
    int batch_size = 0;
    boost::filesystem::path models_dir = "models";
    boost::filesystem::path stats_path;  // empty: keep stats in memory only
    round_t initial_round = 0;
  };

  TrainingCoordinator(const Params& params, std::unique_ptr<Predictor> predictor,
                      ReplayBuffer& buffer);

  /*
   * Runs steps training steps, then checkpoints and advances the round.
   *
   * Throws InvalidStateError if steps <= 0, or if the buffer cannot supply a batch. If any step
   * fails, the round is not advanced and no checkpoint is written.
   */
  void train(int steps);

  Prediction predict(const BoardTensor& board) const;

  round_t round() const { return round_.load(); }
  boost::filesystem::path checkpoint_path(round_t round) const;

  // Snapshot of the stats rows written so far.
  std::vector<TrainingStatsRow> stats_rows() const;

 private:
  const Params params_;
  ReplayBuffer& buffer_;

  mutable std::shared_mutex model_mutex_;
  std::unique_ptr<Predictor> predictor_;
  TrainingStatsWriter stats_writer_;
  std::atomic<round_t> round_;
};

}  // namespace bzero
