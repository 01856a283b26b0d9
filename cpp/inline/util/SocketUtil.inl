#include "util/SocketUtil.hpp"

namespace io {

inline void Socket::write(const void* data, int size) {
  std::unique_lock lock(write_mutex_);
  write_helper(data, size, "Could not write to socket");
}

inline bool Socket::read(void* data, int size) {
  std::unique_lock lock(read_mutex_);
  return read_helper(data, size, "Could not read from socket");
}

}  // namespace io
