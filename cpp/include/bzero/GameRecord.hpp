#pragma once

#include "bzero/BasicTypes.hpp"

#include <memory>
#include <vector>

namespace bzero {

struct Move {
  player_index_t player;
  tile_index_t tile;
};

struct ActionProb {
  tile_index_t action;
  float prob;
};

// Probabilities for the legal moves at one turn. Unlisted tiles are implicitly zero.
using SparsePolicy = std::vector<ActionProb>;

/*
 * One finished self-play game: the move history, the search policy recorded at each move, and the
 * final per-player scores.
 *
 * A GameRecord is validated on construction and immutable afterwards. It is shared between the
 * replay buffer and any in-flight sampling via GameRecord::sptr.
 */
class GameRecord {
 public:
  using sptr = std::shared_ptr<const GameRecord>;

  // Throws ProtocolError if the record is inconsistent (see validate()).
  GameRecord(std::vector<Move> history, std::vector<SparsePolicy> policies,
             const ValueArray& scores);

  template <typename... Ts>
  static sptr make(Ts&&... ts) {
    return std::make_shared<const GameRecord>(std::forward<Ts>(ts)...);
  }

  int num_moves() const { return history_.size(); }
  const std::vector<Move>& history() const { return history_; }
  const std::vector<SparsePolicy>& policies() const { return policies_; }
  const ValueArray& scores() const { return scores_; }

  /*
   * Checks:
   *
   * - history is non-empty and has the same length as policies
   * - every player is in [0, kNumPlayers)
   * - every tile and every policy action is in [0, kNumTiles)
   *
   * Throws ProtocolError on the first violation.
   */
  void validate() const;

 private:
  const std::vector<Move> history_;
  const std::vector<SparsePolicy> policies_;
  const ValueArray scores_;
};

}  // namespace bzero
