#pragma once

#include "bzero/ServerFacade.hpp"
#include "util/SocketUtil.hpp"

#include <boost/json.hpp>

#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace bzero {

/*
 * Serves a ServerFacade over TCP, one length-prefixed json message per request (see Protocol).
 *
 * Each accepted connection gets a dedicated handler thread that reads requests, dispatches them
 * to the facade and writes one reply per request. A request that fails produces an error reply;
 * the connection stays open. The connection is closed when the peer hangs up, or when the stream
 * itself is broken (e.g. an oversized frame).
 *
 * Usage:
 *
 * bzero::RpcServer server(params, facade);
 * server.start();
 * LOG_INFO("Listening on port {}", server.port());
 * server.wait();  // until shutdown() is called from another thread
 */
class RpcServer {
 public:
  struct Params {
    io::port_t port = 0;  // 0: let the OS choose
    int max_connections = 64;
  };

  RpcServer(const Params& params, ServerFacade& facade);
  ~RpcServer();

  // Binds and listens, then starts accepting on a background thread. Throws util::CleanException
  // if the port cannot be bound.
  void start();

  // Blocks until a shutdown() call, possibly from another thread, has completed.
  void wait();

  // Stops accepting, hangs up on every open connection and joins all threads. Idempotent.
  void shutdown();

  // The bound port. Only valid after start().
  io::port_t port() const { return port_; }

  int num_connections() const;

  // Failed accept() calls so far. Each one is logged, then retried after a short pause.
  int num_accept_errors() const;

 private:
  using thread_map_t = std::map<int, std::thread>;

  void accept_loop();
  void serve(int connection_id, io::Socket* socket);
  boost::json::object handle(const boost::json::value& msg);
  void reap_finished_threads();

  const Params params_;
  ServerFacade& facade_;

  io::Socket* listener_ = nullptr;
  io::port_t port_ = 0;
  std::thread accept_thread_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  thread_map_t handler_threads_;
  std::map<int, io::Socket*> connections_;
  std::vector<int> finished_ids_;
  int next_connection_id_ = 0;
  int num_accept_errors_ = 0;
  bool started_ = false;
  bool shutting_down_ = false;
  bool stopped_ = false;
};

}  // namespace bzero
