#pragma once

#include "util/Exception.hpp"

#include <boost/json.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace io {

using file_descriptor_t = int;
using port_t = int;

/*
 * Thrown by Socket::json_read() when a complete frame was read but its payload is not valid json.
 * The stream is still in sync, so the caller may keep using the socket.
 */
class MalformedMessageError : public util::Exception {
 public:
  using util::Exception::Exception;
};

/*
 * Provides thread-safe access to a socket.
 *
 * The main methods are write() and read(). These methods are thread-safe and loop until all
 * requested bytes are written/read.
 *
 * For convenience, there are json_read() and json_write() methods specialized for json format
 * messages. These messages are prefixed with a 4-byte big-endian length header, followed by a
 * serialized json string of that length.
 *
 * Example usage:
 *
 * io::Socket* socket = io::Socket::create_client_socket("localhost", port);
 * socket->json_write(boost::json::object{{"type", "check"}});
 *
 * boost::json::value reply;
 * if (!socket->json_read(&reply)) {
 *   // peer closed the connection
 * }
 * io::Socket::destroy(socket);
 */
class Socket {
 public:
  using map_t = std::map<file_descriptor_t, Socket*>;

  // Frames announcing a larger payload are treated as a broken stream.
  static constexpr uint32_t kMaxJsonMessageSize = 64 * 1024 * 1024;

  static Socket* get_instance(file_descriptor_t fd);

  /*
   * Closes the underlying file descriptor and frees the Socket. The pointer must not be used
   * afterwards.
   */
  static void destroy(Socket* socket);

  /*
   * Thread-safe write to socket. Loops until size bytes are written.
   */
  void write(const void* data, int size);

  /*
   * Thread-safe convenience method for writing json messages. Prepends a 4-byte length header to
   * a serialized json string, and calls write().
   */
  void json_write(const boost::json::value& json);

  /*
   * Thread-safe read from socket.
   *
   * If the socket has been closed, then returns false.
   *
   * Otherwise, loops until size bytes have been read, and returns true.
   */
  bool read(void* data, int size);

  /*
   * Thread-safe convenience method for reading json messages.
   *
   * If the socket has been closed, then returns false.
   *
   * Otherwise, reads a 4-byte length, and then loops until that many more bytes have been read.
   * Deserializes those bytes into *data and returns true. Throws MalformedMessageError if the
   * bytes are not valid json, and util::Exception if the length exceeds kMaxJsonMessageSize.
   */
  bool json_read(boost::json::value* data);

  void shutdown();

  // The locally bound port. Useful after create_server_socket(0, ...).
  port_t local_port() const;

  file_descriptor_t fd() const { return fd_; }

  static Socket* create_server_socket(port_t port, int max_connections);
  static Socket* create_client_socket(std::string const& host, port_t port);
  Socket* accept() const;

 private:
  Socket(file_descriptor_t fd) : fd_(fd) {}
  Socket(const Socket&) = delete;
  Socket& operator=(const Socket&) = delete;

  void write_helper(const void* data, int size, const char* error_msg);
  bool read_helper(void* data, int size, const char* error_msg);

  static std::mutex map_mutex_;
  static map_t map_;

  mutable std::mutex write_mutex_;
  mutable std::mutex read_mutex_;
  const file_descriptor_t fd_;
  std::vector<char> json_buffer_;
  std::atomic<bool> active_{true};
};

}  // namespace io

#include "inline/util/SocketUtil.inl"
