#ifndef __PTYHOST_FD_UTILS__
#define __PTYHOST_FD_UTILS__

#include "Headers.hpp"

namespace ptyhost {
/**
 * @brief Blocking helpers around raw descriptor reads and writes.
 */
class FdUtils {
 public:
  /**
   * @brief Writes the entire buffer to the given descriptor, retrying on
   * EAGAIN and EINTR.
   * @throws std::runtime_error when the descriptor is invalid or closed.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Waits up to `timeoutMs` for `fd` to become readable.
   * @return true when data (or end-of-stream) is available.
   */
  static bool waitForData(int fd, int timeoutMs);

  /** @brief Adds O_NONBLOCK to the descriptor's status flags. */
  static void setNonBlocking(int fd);
};
}  // namespace ptyhost
#endif  // __PTYHOST_FD_UTILS__
