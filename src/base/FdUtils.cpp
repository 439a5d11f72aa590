#include "FdUtils.hpp"

namespace ptyhost {
void FdUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }

  size_t bytesWritten = 0;
  while (bytesWritten < count) {
#ifdef WIN32
    int rc = ::_write(fd, buf + bytesWritten,
                      (unsigned int)(count - bytesWritten));
#else
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
#endif
    if (rc < 0) {
      auto localErrno = errno;
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
#ifndef WIN32
        // Wait for the reader to drain instead of spinning
        fd_set wfd;
        FD_ZERO(&wfd);
        FD_SET(fd, &wfd);
        timeval tv;
        tv.tv_sec = 0;
        tv.tv_usec = 10 * 1000;
        ::select(fd + 1, NULL, &wfd, NULL, &tv);
#endif
        continue;
      }
      VLOG(1) << "Cannot write to fd " << fd << ": " << strerror(localErrno);
      throw std::runtime_error(string("Cannot write to fd: ") +
                               strerror(localErrno));
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to fd: fd closed");
    }
    bytesWritten += rc;
  }
}

bool FdUtils::waitForData(int fd, int timeoutMs) {
#ifdef WIN32
  HANDLE h = (HANDLE)_get_osfhandle(fd);
  if (h == INVALID_HANDLE_VALUE) {
    return true;
  }
  if (GetFileType(h) == FILE_TYPE_PIPE) {
    // Pipes are never signalled as objects, so peek in small steps
    auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (true) {
      DWORD available = 0;
      if (!PeekNamedPipe(h, NULL, 0, NULL, &available, NULL)) {
        // Broken pipe: let the caller observe end-of-stream
        return true;
      }
      if (available > 0) {
        return true;
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        return false;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }
  return WaitForSingleObject(h, timeoutMs) == WAIT_OBJECT_0;
#else
  fd_set rfd;
  FD_ZERO(&rfd);
  FD_SET(fd, &rfd);
  timeval tv;
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  int rc = ::select(fd + 1, &rfd, NULL, NULL, &tv);
  if (rc < 0) {
    if (errno == EINTR) {
      return false;
    }
    FATAL_FAIL(rc);
  }
  return rc > 0 && FD_ISSET(fd, &rfd);
#endif
}

void FdUtils::setNonBlocking(int fd) {
#ifndef WIN32
  int opts = fcntl(fd, F_GETFL);
  FATAL_FAIL(opts);
  opts |= O_NONBLOCK;
  FATAL_FAIL(fcntl(fd, F_SETFL, opts));
#endif
}
}  // namespace ptyhost
