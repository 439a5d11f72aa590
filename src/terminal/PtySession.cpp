#include "PtySession.hpp"

#include "FdUtils.hpp"
#include "FocusEventFilter.hpp"

namespace ptyhost {
volatile sig_atomic_t PtySession::stopRequested = 0;

// Upper bound on what is forwarded after the child has exited, in case a
// grandchild keeps the terminal busy
#define MAX_DRAIN_CHUNKS (64)

PtySession::PtySession(shared_ptr<PtyBackend> _backend,
                       const TerminalSize& _initialSize,
                       const vector<string>& _command, int _inputFd,
                       int _outputFd, int _pollIntervalMs)
    : backend(_backend),
      initialSize(_initialSize),
      command(_command),
      inputFd(_inputFd),
      outputFd(_outputFd),
      pollIntervalMs(_pollIntervalMs),
      inputOpen(true),
      outputOpen(true),
      holdingInput(false),
      state(STARTING) {}

PtySession::~PtySession() {
  lock_guard<std::recursive_mutex> guard(stateMutex);
  if (state == RUNNING || state == TERMINATING) {
    finish();
  }
}

void PtySession::requestStop() { stopRequested = 1; }

void PtySession::clearStopRequest() { stopRequested = 0; }

int PtySession::exitCode() {
  // Collects a child that exited after the loop stopped watching it
  backend->isAlive();
  return backend->exitCode();
}

PtySession::State PtySession::getState() {
  lock_guard<std::recursive_mutex> guard(stateMutex);
  return state;
}

void PtySession::start() {
  try {
    backend->allocate(initialSize, command);
  } catch (const AllocationError& ae) {
    lock_guard<std::recursive_mutex> guard(stateMutex);
    state = TERMINATED;
    throw;
  }
  lock_guard<std::recursive_mutex> guard(stateMutex);
  state = RUNNING;
}

void PtySession::run() {
  if (getState() != RUNNING) {
    STFATAL << "Session must be started before it runs";
  }
  if (backend->getFd() >= 0) {
    runPollLoop();
  } else {
    runThreadedLoop();
  }
  LOG(INFO) << "Session finished, child status " << exitCode();
}

void PtySession::shutdown() { beginTermination("Shutdown requested"); }

void PtySession::beginTermination(const string& reason) {
  lock_guard<std::recursive_mutex> guard(stateMutex);
  if (state != RUNNING) {
    return;
  }
  LOG(INFO) << reason << ", ending session";
  state = TERMINATING;
}

bool PtySession::keepRunning() {
  if (stopRequested) {
    beginTermination("Stop signal received");
  }
  return getState() == RUNNING;
}

void PtySession::runPollLoop() {
#ifdef WIN32
  STFATAL << "Pollable terminals are not supported on Windows";
#else
  int masterFd = backend->getFd();
  while (keepRunning()) {
    fd_set rfd;
    fd_set wfd;
    timeval tv;

    FD_ZERO(&rfd);
    FD_ZERO(&wfd);
    FD_SET(masterFd, &rfd);
    int maxfd = masterFd;
    if (!inputQueue.empty()) {
      FD_SET(masterFd, &wfd);
    }
    // A full queue stops input reads until the child catches up
    bool readInput = inputOpen && inputQueue.canAcceptMore();
    if (readInput) {
      FD_SET(inputFd, &rfd);
      maxfd = max(masterFd, inputFd);
    }
    tv.tv_sec = pollIntervalMs / 1000;
    tv.tv_usec = (pollIntervalMs % 1000) * 1000;
    int rc = select(maxfd + 1, &rfd, &wfd, NULL, &tv);
    if (rc < 0) {
      if (GetErrno() != EINTR) {
        FATAL_FAIL(rc);
      }
      // A signal, most likely the stop request; fall through to the checks
      FD_ZERO(&rfd);
      FD_ZERO(&wfd);
    }
    VLOG(4) << "select is done";

    if (rc > 0 && FD_ISSET(masterFd, &rfd)) {
      if (!pumpOutput()) {
        beginTermination("Terminal session ended");
        break;
      }
    }

    if (rc > 0 && FD_ISSET(masterFd, &wfd)) {
      writeQueuedInput();
    }

    if (rc > 0 && readInput && FD_ISSET(inputFd, &rfd)) {
      pumpInput();
    }

    flushIdleInput();

    if (!backend->isAlive()) {
      drainOutput();
      beginTermination("Child process exited");
    }
  }
  finish();
#endif
}

void PtySession::runThreadedLoop() {
  std::thread outputThread([this]() {
    el::Helpers::setThreadName("pty-output");
    char b[BUF_SIZE];
    while (true) {
      int rc = backend->read(b, BUF_SIZE);
      if (rc > 0) {
        relayOutput(string(b, rc));
        continue;
      }
      if (rc < 0 && (errno == EAGAIN || errno == EINTR)) {
        continue;
      }
      if (rc < 0) {
        LOG(ERROR) << "Terminal read error: " << strerror(errno);
      }
      break;
    }
    beginTermination("Terminal session ended");
  });

  while (keepRunning()) {
    if (!inputQueue.empty()) {
      writeQueuedInput();
    }
    if (inputOpen && inputQueue.canAcceptMore()) {
      if (FdUtils::waitForData(inputFd,
                               inputQueue.empty() ? pollIntervalMs : 1)) {
        pumpInput();
      }
    } else {
      // Nothing to wait on but the terminal taking queued input
      std::this_thread::sleep_for(std::chrono::milliseconds(
          inputQueue.empty() ? pollIntervalMs : 1));
    }
    flushIdleInput();

    if (!backend->isAlive()) {
      beginTermination("Child process exited");
    }
  }

  // Closing the backend is what unblocks the output thread's read
  backend->close();
  outputThread.join();
  finish();
}

bool PtySession::pumpOutput() {
  char b[BUF_SIZE];
  int rc = backend->read(b, BUF_SIZE);
  int readErrno = errno;  // Save errno before any logging
  if (rc > 0) {
    VLOG(4) << "Read " << rc << " bytes from terminal";
    relayOutput(string(b, rc));
    return true;
  }
  if (rc == 0) {
    LOG(INFO) << "Terminal reached end-of-stream";
    return false;
  }
  if (readErrno == EAGAIN || readErrno == EWOULDBLOCK || readErrno == EINTR) {
    return true;
  }
  if (readErrno == EIO) {
    // Linux reports EIO once the last subordinate descriptor is closed
    LOG(INFO) << "Terminal closed by the child";
  } else {
    LOG(ERROR) << "Terminal read error: " << readErrno << " "
               << strerror(readErrno);
  }
  return false;
}

void PtySession::relayOutput(const string& data) {
  if (!outputOpen) {
    return;
  }
  string filtered =
      backend->filtersFocusEvents() ? FocusEventFilter::filter(data) : data;
  if (filtered.empty()) {
    return;
  }
  try {
    FdUtils::writeAll(outputFd, filtered.c_str(), filtered.length());
  } catch (const std::runtime_error& re) {
    // Keep draining the terminal so the child never blocks on a full pty
    LOG(ERROR) << "Cannot write terminal output, discarding from now on: "
               << re.what();
    outputOpen = false;
  }
}

void PtySession::pumpInput() {
  char b[BUF_SIZE];
#ifdef WIN32
  int rc = ::_read(inputFd, b, BUF_SIZE);
#else
  int rc = (int)::read(inputFd, b, BUF_SIZE);
#endif
  int readErrno = errno;
  if (rc > 0) {
    VLOG(4) << "Read " << rc << " bytes of input";
    applyEvents(decoder.decode(string(b, rc)));
    noteHeldInput();
    return;
  }
  if (rc < 0 &&
      (readErrno == EAGAIN || readErrno == EWOULDBLOCK || readErrno == EINTR)) {
    return;
  }
  if (rc == 0) {
    LOG(INFO) << "Input reached end-of-stream";
  } else {
    LOG(ERROR) << "Input read error: " << readErrno << " "
               << strerror(readErrno);
  }
  inputOpen = false;
  holdingInput = false;
  string rest = decoder.flushAll();
  if (!rest.empty()) {
    queueForChild(rest);
  }
}

void PtySession::applyEvents(const vector<InputEvent>& events) {
  for (const auto& event : events) {
    if (event.type == InputEvent::DECODE_ERROR) {
      LOG(WARNING) << "Dropping malformed resize directive: " << event.data;
    } else {
      inputQueue.push(event);
    }
  }
  writeQueuedInput();
}

void PtySession::applyResize(const TerminalSize& size) {
  try {
    backend->resize(size);
  } catch (const ResizeError& re) {
    LOG(WARNING) << "Ignoring resize to " << size << ": " << re.what();
  }
}

void PtySession::queueForChild(const string& data) {
  inputQueue.push(InputEvent::makeData(data));
  writeQueuedInput();
}

void PtySession::writeQueuedInput() {
  while (!inputQueue.empty()) {
    if (inputQueue.front().type == InputEvent::RESIZE) {
      applyResize(inputQueue.front().size);
      inputQueue.pop();
      continue;
    }

    size_t count;
    const char* data = inputQueue.peekData(&count);
    int rc;
    try {
      rc = backend->writeSome(data, (int)min(count, (size_t)BUF_SIZE));
    } catch (const std::runtime_error& re) {
      LOG(ERROR) << "Cannot write to terminal: " << re.what();
      inputQueue.clear();
      return;
    }
    if (rc < 0) {
      int writeErrno = errno;
      if (writeErrno == EAGAIN || writeErrno == EWOULDBLOCK ||
          writeErrno == EINTR) {
        // Resumes once the terminal is writable again
        return;
      }
      // The read side notices a dead terminal and ends the session
      LOG(ERROR) << "Cannot write to terminal: " << writeErrno << " "
                 << strerror(writeErrno);
      inputQueue.clear();
      return;
    }
    VLOG(4) << "Wrote " << rc << " bytes to terminal";
    inputQueue.consume(rc);
  }
}

void PtySession::noteHeldInput() {
  if (!decoder.hasPartialPrefix()) {
    holdingInput = false;
    return;
  }
  if (!holdingInput) {
    holdingInput = true;
    heldSince = std::chrono::steady_clock::now();
  }
}

void PtySession::flushIdleInput() {
  if (!holdingInput || std::chrono::steady_clock::now() - heldSince <
                           std::chrono::milliseconds(pollIntervalMs)) {
    return;
  }
  holdingInput = false;
  string released = decoder.flushPartialPrefix();
  if (!released.empty()) {
    VLOG(3) << "Releasing " << released.size() << " idle escape bytes";
    queueForChild(released);
  }
}

void PtySession::drainOutput() {
  int masterFd = backend->getFd();
  if (masterFd < 0) {
    return;
  }
  for (int a = 0; a < MAX_DRAIN_CHUNKS; a++) {
    if (!FdUtils::waitForData(masterFd, 0) || !pumpOutput()) {
      return;
    }
  }
}

void PtySession::finish() {
  lock_guard<std::recursive_mutex> guard(stateMutex);
  if (state == TERMINATED) {
    return;
  }
  state = TERMINATING;
  backend->close();
  // terminate() reaps a child that already exited instead of signalling it
  backend->terminate();
  state = TERMINATED;
  LOG(INFO) << "Session terminated";
}
}  // namespace ptyhost
