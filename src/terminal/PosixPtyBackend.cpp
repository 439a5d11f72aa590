#ifndef WIN32
#include "PosixPtyBackend.hpp"

#include "FdUtils.hpp"

namespace ptyhost {
PosixPtyBackend::PosixPtyBackend() : masterFd(-1) {}

PosixPtyBackend::~PosixPtyBackend() { close(); }

int64_t PosixPtyBackend::allocate(const TerminalSize& initialSize,
                                  const vector<string>& command) {
  if (masterFd >= 0) {
    throw AllocationError("Pseudo-terminal is already allocated");
  }
  if (command.empty()) {
    throw AllocationError("No command to run");
  }
  if (!initialSize.isValid()) {
    std::ostringstream ss;
    ss << "Invalid initial terminal size " << initialSize;
    throw AllocationError(ss.str());
  }

  // The child reports a failed exec through this pipe.  A successful exec
  // closes it, which the parent sees as end-of-stream.
  int statusPipe[2];
  if (::pipe(statusPipe) == -1) {
    throw AllocationError(string("Cannot create status pipe: ") +
                          strerror(errno));
  }
  FATAL_FAIL(fcntl(statusPipe[0], F_SETFD, FD_CLOEXEC));
  FATAL_FAIL(fcntl(statusPipe[1], F_SETFD, FD_CLOEXEC));

  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_col = (unsigned short)initialSize.columns;
  win.ws_row = (unsigned short)initialSize.rows;

  // Block all signals across the fork so no handler runs in the child
  // before exec
  sigset_t allSignals, oldMask;
  sigfillset(&allSignals);
  pthread_sigmask(SIG_SETMASK, &allSignals, &oldMask);

  int fd = -1;
  pid_t pid = forkpty(&fd, NULL, NULL, &win);
  int forkErrno = errno;
  if (pid == 0) {
    ::close(statusPipe[0]);
    runChild(command, statusPipe[1]);
  }

  pthread_sigmask(SIG_SETMASK, &oldMask, NULL);
  ::close(statusPipe[1]);

  if (pid == -1) {
    ::close(statusPipe[0]);
    throw AllocationError(string("forkpty failed: ") + strerror(forkErrno));
  }

  int childErrno = 0;
  ssize_t rc;
  do {
    rc = ::read(statusPipe[0], &childErrno, sizeof(childErrno));
  } while (rc == -1 && errno == EINTR);
  ::close(statusPipe[0]);

  if (rc > 0) {
    // The child is about to _exit, collect it so it does not linger
    int status;
    while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
    ::close(fd);
    throw AllocationError("Cannot execute " + command[0] + ": " +
                          strerror(childErrno));
  }

  masterFd = fd;
  FdUtils::setNonBlocking(masterFd);
  {
    lock_guard<std::mutex> guard(resizeMutex);
    size = initialSize;
  }
  supervisor.reset(new ProcessSupervisor(pid));
  LOG(INFO) << "pty opened " << masterFd << " for child " << pid << " ("
            << command[0] << ") at " << initialSize;
  return pid;
}

void PosixPtyBackend::runChild(const vector<string>& command, int statusFd) {
  // Give the command pristine signal handling, the way a shell would
  struct sigaction defaultAction;
  memset(&defaultAction, 0, sizeof(defaultAction));
  defaultAction.sa_handler = SIG_DFL;
  sigemptyset(&defaultAction.sa_mask);
  for (int i = 1; i < NSIG; i++) {
    sigaction(i, &defaultAction, NULL);
  }
  sigset_t noSignals;
  sigemptyset(&noSignals);
  sigprocmask(SIG_SETMASK, &noSignals, NULL);

  vector<char*> argv;
  for (const auto& arg : command) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(NULL);
  execvp(argv[0], &argv[0]);

  int execErrno = errno;
  if (::write(statusFd, &execErrno, sizeof(execErrno)) < 0) {
    // Nothing left to report to
  }
  _exit(127);
}

int PosixPtyBackend::read(char* buf, int count) {
  if (masterFd < 0) {
    errno = EBADF;
    return -1;
  }
  return (int)::read(masterFd, buf, count);
}

void PosixPtyBackend::write(const string& data) {
  if (masterFd < 0) {
    throw std::runtime_error("Write to a closed pseudo-terminal");
  }
  FdUtils::writeAll(masterFd, data.c_str(), data.length());
}

int PosixPtyBackend::writeSome(const char* buf, int count) {
  if (masterFd < 0) {
    errno = EBADF;
    return -1;
  }
  return (int)::write(masterFd, buf, count);
}

void PosixPtyBackend::resize(const TerminalSize& newSize) {
  lock_guard<std::mutex> guard(resizeMutex);
  if (!newSize.isValid()) {
    std::ostringstream ss;
    ss << "Invalid terminal size " << newSize;
    throw ResizeError(ss.str());
  }
  if (masterFd < 0) {
    throw ResizeError("Resize of a closed pseudo-terminal");
  }

  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_col = (unsigned short)newSize.columns;
  win.ws_row = (unsigned short)newSize.rows;
  if (ioctl(masterFd, TIOCSWINSZ, &win) == -1) {
    throw ResizeError(string("TIOCSWINSZ failed: ") + strerror(errno));
  }
  size = newSize;

  // forkpty makes the child a session leader, so its pid is also its
  // process group id
  if (supervisor && supervisor->isAlive()) {
    if (::kill(-(pid_t)supervisor->getPid(), SIGWINCH) == -1 &&
        errno != ESRCH) {
      LOG(WARNING) << "Cannot deliver SIGWINCH: " << strerror(errno);
    }
  }
  VLOG(1) << "Terminal resized to " << newSize;
}

TerminalSize PosixPtyBackend::getSize() {
  lock_guard<std::mutex> guard(resizeMutex);
  return size;
}

bool PosixPtyBackend::isAlive() {
  if (!supervisor) {
    return false;
  }
  return supervisor->isAlive();
}

void PosixPtyBackend::terminate() {
  if (supervisor) {
    supervisor->terminate();
  }
}

void PosixPtyBackend::close() {
  lock_guard<std::mutex> guard(resizeMutex);
  if (masterFd < 0) {
    return;
  }
  VLOG(1) << "Closing pty " << masterFd;
  ::close(masterFd);
  masterFd = -1;
}

int PosixPtyBackend::exitCode() {
  if (!supervisor) {
    return -1;
  }
  return supervisor->exitCode();
}
}  // namespace ptyhost
#endif
