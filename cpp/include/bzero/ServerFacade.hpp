#pragma once

#include "bzero/BasicTypes.hpp"
#include "bzero/Exceptions.hpp"
#include "bzero/GameRecord.hpp"
#include "bzero/ReplayBuffer.hpp"
#include "bzero/RoundGate.hpp"
#include "bzero/TrainingCoordinator.hpp"
#include "bzero/TrainingTypes.hpp"

namespace bzero {

/*
 * The three client-facing operations. Transport-agnostic; see RpcServer for the TCP binding.
 *
 * All methods may be called concurrently from any number of threads.
 */
class ServerFacade {
 public:
  ServerFacade(ReplayBuffer& buffer, TrainingCoordinator& coordinator, RoundGate& gate)
      : buffer_(buffer), coordinator_(coordinator), gate_(gate) {}

  // Read-only inference against the current model. player is not an input to the network.
  Prediction predict(const BoardTensor& board, player_index_t player) const;

  round_t check() const { return coordinator_.round(); }

  /*
   * Inserts the game and notifies the round gate. If this call completes a quota, it blocks until
   * the triggered training finishes. Training failures propagate as exceptions.
   */
  StatusCode save(GameRecord::sptr game);

 private:
  ReplayBuffer& buffer_;
  TrainingCoordinator& coordinator_;
  RoundGate& gate_;
};

}  // namespace bzero
