#include "bzero/TargetBuilder.hpp"

#include "bzero/Exceptions.hpp"
#include "util/Random.hpp"

namespace bzero {

TrainingExample TargetBuilder::build(std::mt19937& prng, const GameRecord& game) {
  int move_index = util::Random::uniform_sample(prng, 0, game.num_moves());
  bool flip_rows = util::Random::coin_flip(prng);
  bool flip_cols = util::Random::coin_flip(prng);
  return build(game, move_index, flip_rows, flip_cols);
}

TrainingExample TargetBuilder::build(const GameRecord& game, int move_index, bool flip_rows,
                                     bool flip_cols) {
  if (move_index < 0 || move_index >= game.num_moves()) {
    throw InvalidStateError("move index {} out of range [0, {})", move_index, game.num_moves());
  }

  TrainingExample example;
  example.state.setZero();
  example.policy.setZero();

  const auto& history = game.history();
  for (int j = 0; j < move_index; ++j) {
    const Move& move = history[j];
    example.state(move.player, tile_row(move.tile), tile_col(move.tile)) = 1;
  }

  for (const ActionProb& ap : game.policies()[move_index]) {
    example.policy(tile_row(ap.action), tile_col(ap.action)) = ap.prob;
    example.state(kLegalMovePlane, tile_row(ap.action), tile_col(ap.action)) = 1;
  }

  example.value = game.scores();

  if (flip_rows) flip(example, kRowAxis);
  if (flip_cols) flip(example, kColAxis);
  return example;
}

void TargetBuilder::flip(TrainingExample& example, spatial_axis_t axis) {
  // The state has a leading plane dimension; the policy does not.
  BoardTensor state = eigen_util::reverse(example.state, axis + 1);
  PolicyTensor policy = eigen_util::reverse(example.policy, axis);
  example.state = state;
  example.policy = policy;
}

}  // namespace bzero
