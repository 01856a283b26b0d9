#pragma once

#include "bzero/BasicTypes.hpp"
#include "bzero/GameRecord.hpp"
#include "bzero/TrainingTypes.hpp"

#include <random>

namespace bzero {

/*
 * Turns a position of a GameRecord into a TrainingExample.
 *
 * The state is the board *before* the chosen move: occupancy planes hold the tiles of every
 * earlier move, indexed by absolute player, and the legal-move plane marks every action listed in
 * that move's policy. The policy target is the recorded policy, densified over all tiles. The
 * value target is the game's final scores, identical for every position of the game.
 *
 * Augmentation flips state and policy together along each spatial axis independently with
 * probability 1/2, so that action indices stay aligned with board geometry.
 */
struct TargetBuilder {
  // Picks a uniformly random move index and random flips using prng.
  static TrainingExample build(std::mt19937& prng, const GameRecord& game);

  // Deterministic variant. Throws InvalidStateError if move_index is out of range.
  static TrainingExample build(const GameRecord& game, int move_index, bool flip_rows,
                               bool flip_cols);

  static void flip(TrainingExample& example, spatial_axis_t axis);
};

}  // namespace bzero
