#include "bzero/ServerFacade.hpp"

#include "util/LoggingUtil.hpp"

namespace bzero {

Prediction ServerFacade::predict(const BoardTensor& board, player_index_t player) const {
  LOG_TRACE("ServerFacade::{}() player={}", __func__, player);
  return coordinator_.predict(board);
}

StatusCode ServerFacade::save(GameRecord::sptr game) {
  int num_moves = game->num_moves();
  buffer_.insert(std::move(game));
  LOG_INFO("Saved game with {} moves (buffer size: {})", num_moves, buffer_.size());
  gate_.notify_save();
  return StatusCode::kOk;
}

}  // namespace bzero
