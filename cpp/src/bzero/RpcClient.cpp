#include "bzero/RpcClient.hpp"

#include "bzero/Exceptions.hpp"
#include "bzero/Protocol.hpp"
#include "util/Exception.hpp"

#include <string>

namespace bzero {

RpcClient::RpcClient(const std::string& host, io::port_t port)
    : socket_(io::Socket::create_client_socket(host, port)) {}

RpcClient::~RpcClient() { io::Socket::destroy(socket_); }

Prediction RpcClient::predict(const BoardTensor& board, player_index_t player) {
  return Protocol::decode_prediction(
    checked_request(Protocol::encode_predict_request(board, player), "target"));
}

round_t RpcClient::check() {
  return Protocol::decode_status(checked_request(Protocol::encode_check_request(), "status"));
}

int RpcClient::save(const GameRecord& game) {
  return Protocol::decode_status(checked_request(Protocol::encode_save_request(game), "status"));
}

boost::json::value RpcClient::request(const boost::json::value& msg) {
  socket_->json_write(msg);
  boost::json::value reply;
  if (!socket_->json_read(&reply)) {
    throw util::Exception("RpcClient: server closed the connection");
  }
  return reply;
}

boost::json::value RpcClient::checked_request(const boost::json::value& msg,
                                              const char* expected_type) {
  boost::json::value reply = request(msg);
  const boost::json::object* obj = reply.if_object();
  const boost::json::value* type = obj ? obj->if_contains("type") : nullptr;
  if (!type || !type->is_string()) {
    throw ProtocolError("RpcClient: reply has no type");
  }

  if (type->get_string() == "error") {
    int code = Protocol::decode_status(reply);
    const boost::json::value* message = obj->if_contains("message");
    std::string text = (message && message->is_string()) ? message->get_string().c_str() : "";
    switch (static_cast<StatusCode>(code)) {
      case StatusCode::kProtocolError:
        throw ProtocolError("{}", text);
      case StatusCode::kInvalidState:
        throw InvalidStateError("{}", text);
      default:
        throw util::Exception("RpcClient: server error {}: {}", code, text);
    }
  }
  if (type->get_string() != expected_type) {
    throw ProtocolError("RpcClient: expected \"{}\" reply, got \"{}\"", expected_type,
                        std::string(type->get_string()));
  }
  return reply;
}

}  // namespace bzero
