#include "util/SocketUtil.hpp"

#include <boost/json/src.hpp>

#include <arpa/inet.h>
#include <chrono>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace io {

std::mutex Socket::map_mutex_;
Socket::map_t Socket::map_;

Socket* Socket::get_instance(file_descriptor_t fd) {
  std::unique_lock lock(map_mutex_);
  auto it = map_.find(fd);
  if (it == map_.end()) {
    auto* instance = new Socket(fd);
    map_[fd] = instance;
    return instance;
  } else {
    return it->second;
  }
}

void Socket::destroy(Socket* socket) {
  {
    std::unique_lock lock(map_mutex_);
    map_.erase(socket->fd_);
    // close() while holding the lock, so that accept() cannot hand out the same fd number and
    // find the stale entry.
    ::close(socket->fd_);
  }
  delete socket;
}

void Socket::json_write(const boost::json::value& json) {
  std::string json_str = boost::json::serialize(json);
  uint32_t length = htonl(static_cast<uint32_t>(json_str.size()));

  std::unique_lock lock(write_mutex_);
  write_helper(&length, sizeof(length), "Could not json_write length to socket");
  write_helper(json_str.c_str(), json_str.size(), "Could not json_write to socket");
}

bool Socket::json_read(boost::json::value* data) {
  std::unique_lock lock(read_mutex_);

  uint32_t length;
  if (!read_helper(&length, sizeof(length), "Could not json_read length from socket")) {
    return false;
  }
  length = ntohl(length);
  if (length > kMaxJsonMessageSize) {
    throw util::Exception("json message length {} exceeds limit of {}", length,
                          kMaxJsonMessageSize);
  }

  json_buffer_.resize(length);
  if (!read_helper(json_buffer_.data(), length, "Could not json_read from socket")) {
    return false;
  }

  boost::json::error_code ec;
  *data = boost::json::parse(boost::json::string_view(json_buffer_.data(), length), ec);
  if (ec) {
    throw MalformedMessageError("Malformed json message: {}", ec.message());
  }
  return true;
}

void Socket::shutdown() {
  if (active_.exchange(false)) {
    ::shutdown(fd_, SHUT_RDWR);
  }
}

port_t Socket::local_port() const {
  sockaddr_in addr;
  socklen_t len = sizeof(addr);
  if (getsockname(fd_, (sockaddr*)&addr, &len) < 0) {
    throw util::Exception("getsockname() failed: {}", std::strerror(errno));
  }
  return ntohs(addr.sin_port);
}

Socket* Socket::create_server_socket(io::port_t port, int max_connections) {
  auto fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    throw util::Exception("Could not create socket");
  }
  const int enable = 1;
  if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(int)) < 0) {
    ::close(fd);
    throw util::Exception("setsockopt(SO_REUSEADDR) failed");
  }

  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = INADDR_ANY;
  if (bind(fd, (sockaddr*)&addr, sizeof(addr)) < 0) {
    ::close(fd);
    throw util::CleanException("Could not bind socket to port {}: {}", port, std::strerror(errno));
  }

  if (listen(fd, max_connections) < 0) {
    ::close(fd);
    throw util::Exception("Could not listen on socket");
  }

  return get_instance(fd);
}

Socket* Socket::create_client_socket(std::string const& host, port_t port) {
  struct hostent* entry = gethostbyname(host.c_str());
  if (!entry || !entry->h_addr_list[0]) {
    throw util::CleanException("Could not resolve host {}", host);
  }

  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  std::memcpy(&addr.sin_addr, entry->h_addr_list[0], sizeof(addr.sin_addr));

  int retry_count = 5;
  int sleep_time_ms = 100;
  while (true) {
    auto fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
      throw util::CleanException("Could not create socket for {}:{}", host, port);
    }
    if (connect(fd, (sockaddr*)&addr, sizeof(addr)) == 0) {
      return get_instance(fd);
    }
    ::close(fd);
    if (retry_count-- == 0) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(sleep_time_ms));
    sleep_time_ms *= 2;
  }
  throw util::CleanException("Could not connect to socket at {}:{}", host, port);
}

Socket* Socket::accept() const {
  auto fd = ::accept(fd_, nullptr, nullptr);
  if (fd < 0) {
    throw util::Exception("Could not accept connection: {}", std::strerror(errno));
  }

  return get_instance(fd);
}

void Socket::write_helper(const void* data, int size, const char* error_msg) {
  int bytes_sent = 0;
  const char* data_ptr = static_cast<const char*>(data);

  while (bytes_sent < size) {
    // MSG_NOSIGNAL: a peer that hung up should surface as an exception, not SIGPIPE.
    int n = send(fd_, data_ptr + bytes_sent, size - bytes_sent, MSG_NOSIGNAL);
    if (n < 0) {
      throw util::Exception("{}: {}", error_msg, std::strerror(errno));
    }
    bytes_sent += n;
  }
}

bool Socket::read_helper(void* data, int size, const char* error_msg) {
  int bytes_read = 0;
  char* data_ptr = static_cast<char*>(data);

  while (bytes_read < size) {
    int n = recv(fd_, data_ptr + bytes_read, size - bytes_read, 0);
    if (n < 0) {
      if (errno == EINTR) continue;
      if (!active_ || errno == ECONNRESET) return false;
      throw util::Exception("{}: {}", error_msg, std::strerror(errno));
    } else if (n == 0) {
      return false;
    }
    bytes_read += n;
  }
  return true;
}

}  // namespace io
