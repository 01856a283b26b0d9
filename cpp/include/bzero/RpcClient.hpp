#pragma once

#include "bzero/BasicTypes.hpp"
#include "bzero/GameRecord.hpp"
#include "bzero/TrainingTypes.hpp"
#include "util/SocketUtil.hpp"

#include <boost/json.hpp>

#include <string>

namespace bzero {

/*
 * Blocking client for RpcServer. Not thread-safe: each thread should use its own RpcClient.
 *
 * Error replies are rethrown locally: ProtocolError for kProtocolError, InvalidStateError for
 * kInvalidState, util::Exception otherwise.
 */
class RpcClient {
 public:
  RpcClient(const std::string& host, io::port_t port);
  ~RpcClient();

  RpcClient(const RpcClient&) = delete;
  RpcClient& operator=(const RpcClient&) = delete;

  Prediction predict(const BoardTensor& board, player_index_t player);
  round_t check();
  int save(const GameRecord& game);

  // Sends msg and returns the raw reply, without interpreting error replies.
  boost::json::value request(const boost::json::value& msg);

 private:
  boost::json::value checked_request(const boost::json::value& msg, const char* expected_type);

  io::Socket* socket_;
};

}  // namespace bzero
