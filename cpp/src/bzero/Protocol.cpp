#include "bzero/Protocol.hpp"

#include <string_view>
#include <vector>

namespace bzero {

namespace detail {

const boost::json::object& as_object(const boost::json::value& v, const char* what) {
  if (!v.is_object()) {
    throw ProtocolError("{} must be an object", what);
  }
  return v.get_object();
}

const boost::json::value& field(const boost::json::object& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    throw ProtocolError("Missing field \"{}\"", key);
  }
  return it->value();
}

const boost::json::array& array_field(const boost::json::object& obj, const char* key) {
  const boost::json::value& v = field(obj, key);
  if (!v.is_array()) {
    throw ProtocolError("Field \"{}\" must be an array", key);
  }
  return v.get_array();
}

int64_t to_int(const boost::json::value& v, const char* what) {
  if (v.is_int64()) return v.get_int64();
  if (v.is_uint64()) return static_cast<int64_t>(v.get_uint64());
  throw ProtocolError("{} must be an integer", what);
}

float to_float(const boost::json::value& v, const char* what) {
  if (v.is_double()) return v.get_double();
  if (v.is_int64()) return v.get_int64();
  if (v.is_uint64()) return v.get_uint64();
  throw ProtocolError("{} must be a number", what);
}

void read_floats(const boost::json::array& arr, const char* key, size_t expected, float* out) {
  if (arr.size() != expected) {
    throw ProtocolError("Field \"{}\" has {} entries, expected {}", key, arr.size(), expected);
  }
  for (size_t i = 0; i < expected; ++i) {
    out[i] = to_float(arr[i], key);
  }
}

boost::json::array write_floats(const float* data, size_t n) {
  boost::json::array arr;
  arr.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    arr.emplace_back(data[i]);
  }
  return arr;
}

template <typename T>
T checked_index(int64_t x, int64_t limit, const char* what) {
  if (x < 0 || x >= limit) {
    throw ProtocolError("{} {} out of range [0, {})", what, x, limit);
  }
  return static_cast<T>(x);
}

}  // namespace detail

Protocol::request_type_t Protocol::decode_type(const boost::json::value& msg) {
  const boost::json::value& type = detail::field(detail::as_object(msg, "message"), "type");
  if (!type.is_string()) {
    throw ProtocolError("Field \"type\" must be a string");
  }
  std::string_view s = type.get_string();
  if (s == "predict") return kPredict;
  if (s == "check") return kCheck;
  if (s == "save") return kSave;
  throw ProtocolError("Unknown message type \"{}\"", s);
}

boost::json::object Protocol::encode_predict_request(const BoardTensor& board,
                                                     player_index_t player) {
  boost::json::object msg;
  msg["type"] = "predict";
  msg["boards"] = detail::write_floats(board.data(), board.size());
  msg["player"] = int(player);
  return msg;
}

boost::json::object Protocol::encode_check_request() {
  boost::json::object msg;
  msg["type"] = "check";
  return msg;
}

boost::json::object Protocol::encode_save_request(const GameRecord& game) {
  boost::json::array history;
  for (const Move& move : game.history()) {
    history.emplace_back(
      boost::json::object{{"player", int(move.player)}, {"tile", int(move.tile)}});
  }

  boost::json::array policies;
  for (const SparsePolicy& policy : game.policies()) {
    boost::json::array probs;
    for (const ActionProb& ap : policy) {
      probs.emplace_back(boost::json::object{{"action", int(ap.action)}, {"prob", ap.prob}});
    }
    policies.emplace_back(boost::json::object{{"probs", std::move(probs)}});
  }

  boost::json::object msg;
  msg["type"] = "save";
  msg["history"] = std::move(history);
  msg["policies"] = std::move(policies);
  msg["values"] = detail::write_floats(game.scores().data(), kNumPlayers);
  return msg;
}

BoardTensor Protocol::decode_board(const boost::json::value& msg) {
  const auto& obj = detail::as_object(msg, "message");
  BoardTensor board;
  detail::read_floats(detail::array_field(obj, "boards"), "boards", board.size(), board.data());
  return board;
}

player_index_t Protocol::decode_player(const boost::json::value& msg) {
  const auto& obj = detail::as_object(msg, "message");
  int64_t player = detail::to_int(detail::field(obj, "player"), "player");
  return detail::checked_index<player_index_t>(player, kNumPlayers, "player");
}

GameRecord::sptr Protocol::decode_game(const boost::json::value& msg) {
  const auto& obj = detail::as_object(msg, "message");

  std::vector<Move> history;
  for (const auto& v : detail::array_field(obj, "history")) {
    const auto& m = detail::as_object(v, "history entry");
    Move move;
    move.player = detail::checked_index<player_index_t>(
      detail::to_int(detail::field(m, "player"), "player"), kNumPlayers, "player");
    move.tile = detail::checked_index<tile_index_t>(
      detail::to_int(detail::field(m, "tile"), "tile"), kNumTiles, "tile");
    history.push_back(move);
  }

  std::vector<SparsePolicy> policies;
  for (const auto& v : detail::array_field(obj, "policies")) {
    SparsePolicy policy;
    for (const auto& p : detail::array_field(detail::as_object(v, "policy"), "probs")) {
      const auto& ap = detail::as_object(p, "probs entry");
      ActionProb entry;
      entry.action = detail::checked_index<tile_index_t>(
        detail::to_int(detail::field(ap, "action"), "action"), kNumTiles, "action");
      entry.prob = detail::to_float(detail::field(ap, "prob"), "prob");
      policy.push_back(entry);
    }
    policies.push_back(std::move(policy));
  }

  ValueArray scores;
  detail::read_floats(detail::array_field(obj, "values"), "values", kNumPlayers, scores.data());

  return GameRecord::make(std::move(history), std::move(policies), scores);
}

boost::json::object Protocol::encode_prediction(const Prediction& prediction) {
  boost::json::object msg;
  msg["type"] = "target";
  msg["policy"] = detail::write_floats(prediction.policy.data(), prediction.policy.size());
  msg["value"] = detail::write_floats(prediction.value.data(), kNumPlayers);
  return msg;
}

boost::json::object Protocol::encode_status(int code) {
  boost::json::object msg;
  msg["type"] = "status";
  msg["code"] = code;
  return msg;
}

boost::json::object Protocol::encode_error(StatusCode code, const std::string& message) {
  boost::json::object msg;
  msg["type"] = "error";
  msg["code"] = static_cast<int>(code);
  msg["message"] = message;
  return msg;
}

Prediction Protocol::decode_prediction(const boost::json::value& msg) {
  const auto& obj = detail::as_object(msg, "message");
  Prediction prediction;
  detail::read_floats(detail::array_field(obj, "policy"), "policy", prediction.policy.size(),
                      prediction.policy.data());
  detail::read_floats(detail::array_field(obj, "value"), "value", kNumPlayers,
                      prediction.value.data());
  return prediction;
}

int Protocol::decode_status(const boost::json::value& msg) {
  const auto& obj = detail::as_object(msg, "message");
  return detail::to_int(detail::field(obj, "code"), "code");
}

}  // namespace bzero
