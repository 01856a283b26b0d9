#include "bzero/RpcServer.hpp"

#include "bzero/Exceptions.hpp"
#include "bzero/Protocol.hpp"
#include "util/Asserts.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <chrono>
#include <exception>

namespace bzero {

namespace {

constexpr std::chrono::milliseconds kAcceptRetryDelay(100);

}  // namespace

RpcServer::RpcServer(const Params& params, ServerFacade& facade)
    : params_(params), facade_(facade) {}

RpcServer::~RpcServer() { shutdown(); }

void RpcServer::start() {
  std::unique_lock lock(mutex_);
  RELEASE_ASSERT(!started_, "RpcServer::start() called twice");
  listener_ = io::Socket::create_server_socket(params_.port, params_.max_connections);
  port_ = listener_->local_port();
  started_ = true;
  accept_thread_ = std::thread([this]() { accept_loop(); });
  LOG_INFO("RpcServer listening on port {}", port_);
}

void RpcServer::wait() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this]() { return stopped_; });
}

void RpcServer::shutdown() {
  thread_map_t threads;
  {
    std::unique_lock lock(mutex_);
    if (!started_) return;
    if (shutting_down_) {
      // Another thread is already shutting down; wait for it to finish.
      cv_.wait(lock, [this]() { return stopped_; });
      return;
    }
    shutting_down_ = true;
    cv_.notify_all();
    listener_->shutdown();
    for (auto& [id, socket] : connections_) {
      socket->shutdown();
    }
    // accept_loop() checks shutting_down_ under mutex_ before registering a handler, so no
    // handler can be added after this point.
    threads.swap(handler_threads_);
  }

  if (accept_thread_.joinable()) accept_thread_.join();
  for (auto& [id, thread] : threads) {
    thread.join();
  }
  io::Socket::destroy(listener_);
  listener_ = nullptr;
  LOG_INFO("RpcServer on port {} shut down", port_);

  std::unique_lock lock(mutex_);
  stopped_ = true;
  cv_.notify_all();
}

int RpcServer::num_connections() const {
  std::unique_lock lock(mutex_);
  return connections_.size();
}

int RpcServer::num_accept_errors() const {
  std::unique_lock lock(mutex_);
  return num_accept_errors_;
}

void RpcServer::accept_loop() {
  while (true) {
    io::Socket* socket = nullptr;
    try {
      socket = listener_->accept();
    } catch (const util::Exception& e) {
      std::unique_lock lock(mutex_);
      if (shutting_down_) return;
      num_accept_errors_++;
      LOG_ERROR("RpcServer: {}", e.what());
      // Errors such as EMFILE persist; pause before retrying.
      if (cv_.wait_for(lock, kAcceptRetryDelay, [this]() { return shutting_down_; })) return;
      continue;
    }

    std::unique_lock lock(mutex_);
    if (shutting_down_) {
      io::Socket::destroy(socket);
      return;
    }
    int id = next_connection_id_++;
    connections_[id] = socket;
    handler_threads_[id] = std::thread([this, id, socket]() { serve(id, socket); });
    LOG_INFO("RpcServer: connection {} opened (fd={})", id, socket->fd());
    lock.unlock();

    reap_finished_threads();
  }
}

void RpcServer::serve(int connection_id, io::Socket* socket) {
  try {
    while (true) {
      boost::json::value msg;
      boost::json::object reply;
      try {
        if (!socket->json_read(&msg)) break;
        reply = handle(msg);
      } catch (const io::MalformedMessageError& e) {
        LOG_WARN("RpcServer: connection {}: {}", connection_id, e.what());
        reply = Protocol::encode_error(StatusCode::kProtocolError, e.what());
      }
      socket->json_write(reply);
    }
  } catch (const util::Exception& e) {
    LOG_ERROR("RpcServer: connection {} dropped: {}", connection_id, e.what());
  }

  std::unique_lock lock(mutex_);
  connections_.erase(connection_id);
  io::Socket::destroy(socket);
  finished_ids_.push_back(connection_id);
  LOG_INFO("RpcServer: connection {} closed", connection_id);
}

boost::json::object RpcServer::handle(const boost::json::value& msg) {
  try {
    switch (Protocol::decode_type(msg)) {
      case Protocol::kPredict: {
        BoardTensor board = Protocol::decode_board(msg);
        player_index_t player = Protocol::decode_player(msg);
        return Protocol::encode_prediction(facade_.predict(board, player));
      }
      case Protocol::kCheck:
        return Protocol::encode_status(facade_.check());
      case Protocol::kSave: {
        GameRecord::sptr game = Protocol::decode_game(msg);
        return Protocol::encode_status(static_cast<int>(facade_.save(std::move(game))));
      }
    }
    throw util::Exception("unreachable");
  } catch (const ProtocolError& e) {
    LOG_WARN("RpcServer: protocol error: {}", e.what());
    return Protocol::encode_error(StatusCode::kProtocolError, e.what());
  } catch (const InvalidStateError& e) {
    LOG_ERROR("RpcServer: invalid state: {}", e.what());
    return Protocol::encode_error(StatusCode::kInvalidState, e.what());
  } catch (const std::exception& e) {
    LOG_ERROR("RpcServer: internal error: {}", e.what());
    return Protocol::encode_error(StatusCode::kInternalError, e.what());
  }
}

void RpcServer::reap_finished_threads() {
  thread_map_t finished;
  {
    std::unique_lock lock(mutex_);
    for (int id : finished_ids_) {
      auto it = handler_threads_.find(id);
      if (it != handler_threads_.end()) {
        finished.insert(handler_threads_.extract(it));
      }
    }
    finished_ids_.clear();
  }
  for (auto& [id, thread] : finished) {
    thread.join();
  }
}

}  // namespace bzero
