#pragma once

#include "bzero/BasicTypes.hpp"
#include "bzero/Exceptions.hpp"
#include "bzero/GameRecord.hpp"
#include "bzero/TrainingTypes.hpp"

#include <boost/json.hpp>

#include <cstdint>
#include <string>

namespace bzero {

/*
 * JSON message codec for the training server. Each message is an object with a "type" field:
 *
 * {"type": "predict", "boards": [kNumPlanes*kNumTiles floats], "player": p}
 *   -> {"type": "target", "policy": [kNumTiles floats], "value": [kNumPlayers floats]}
 *
 * {"type": "check"}
 *   -> {"type": "status", "code": round}
 *
 * {"type": "save", "history": [{"player": p, "tile": t}, ...],
 *  "policies": [{"probs": [{"action": a, "prob": x}, ...]}, ...], "values": [kNumPlayers floats]}
 *   -> {"type": "status", "code": 0}
 *
 * Any failure -> {"type": "error", "code": c, "message": "..."}
 *
 * Decoders throw ProtocolError on missing fields, wrong types, wrong lengths, or out-of-range
 * indices.
 */
struct Protocol {
  enum request_type_t : int8_t { kPredict, kCheck, kSave };

  static request_type_t decode_type(const boost::json::value& msg);

  // Client side
  static boost::json::object encode_predict_request(const BoardTensor& board,
                                                    player_index_t player);
  static boost::json::object encode_check_request();
  static boost::json::object encode_save_request(const GameRecord& game);

  // Server side
  static BoardTensor decode_board(const boost::json::value& msg);
  static player_index_t decode_player(const boost::json::value& msg);
  static GameRecord::sptr decode_game(const boost::json::value& msg);

  static boost::json::object encode_prediction(const Prediction& prediction);
  static boost::json::object encode_status(int code);
  static boost::json::object encode_error(StatusCode code, const std::string& message);

  // Client side, replies
  static Prediction decode_prediction(const boost::json::value& msg);
  static int decode_status(const boost::json::value& msg);
};

}  // namespace bzero
