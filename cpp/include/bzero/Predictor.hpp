#pragma once

#include "bzero/BasicTypes.hpp"
#include "bzero/TrainingTypes.hpp"

#include <boost/filesystem.hpp>

namespace bzero {

/*
 * The neural network, as seen by the training server.
 *
 * TrainingCoordinator serializes train_step() and save_checkpoint() against each other and against
 * predict(). predict() may be called from several threads at once. load_checkpoint() is only
 * called before the predictor is handed to a TrainingCoordinator.
 */
class Predictor {
 public:
  virtual ~Predictor() = default;

  // Raw policy logits over all tiles, and the value head's output.
  virtual Prediction predict(const BoardTensor& board) = 0;

  // One optimizer step on the batch. Returns the losses computed before the step.
  virtual Losses train_step(const TrainingBatch& batch) = 0;

  virtual void save_checkpoint(const boost::filesystem::path& path) = 0;
  virtual void load_checkpoint(const boost::filesystem::path& path) = 0;
};

}  // namespace bzero
