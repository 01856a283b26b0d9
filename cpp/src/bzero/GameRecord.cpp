#include "bzero/GameRecord.hpp"

#include "bzero/Exceptions.hpp"

namespace bzero {

GameRecord::GameRecord(std::vector<Move> history, std::vector<SparsePolicy> policies,
                       const ValueArray& scores)
    : history_(std::move(history)), policies_(std::move(policies)), scores_(scores) {
  validate();
}

void GameRecord::validate() const {
  if (history_.empty()) {
    throw ProtocolError("GameRecord has an empty history");
  }
  if (history_.size() != policies_.size()) {
    throw ProtocolError("GameRecord history/policies length mismatch ({} != {})", history_.size(),
                        policies_.size());
  }

  for (size_t i = 0; i < history_.size(); ++i) {
    const Move& move = history_[i];
    if (move.player < 0 || move.player >= kNumPlayers) {
      throw ProtocolError("Move {}: player {} out of range", i, move.player);
    }
    if (move.tile < 0 || move.tile >= kNumTiles) {
      throw ProtocolError("Move {}: tile {} out of range", i, move.tile);
    }
    for (const ActionProb& ap : policies_[i]) {
      if (ap.action < 0 || ap.action >= kNumTiles) {
        throw ProtocolError("Policy {}: action {} out of range", i, ap.action);
      }
    }
  }
}

}  // namespace bzero
