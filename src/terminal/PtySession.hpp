#ifndef __PTYHOST_PTY_SESSION_HPP__
#define __PTYHOST_PTY_SESSION_HPP__

#include "ChildInputQueue.hpp"
#include "Headers.hpp"
#include "PtyBackend.hpp"
#include "ResizeSequenceDecoder.hpp"
#include "TerminalSize.hpp"

namespace ptyhost {
/**
 * @brief Relays bytes between the embedder's stdio and a pseudo-terminal,
 * acting on resize directives found in the input.
 *
 * Backends with a pollable master are served by a single select() loop.
 * Backends without one get a dedicated output thread while the calling
 * thread relays input.  Either way the poll interval bounds how long a stop
 * request or a dead child goes unnoticed.
 */
class PtySession {
 public:
  enum State { STARTING, RUNNING, TERMINATING, TERMINATED };

  PtySession(shared_ptr<PtyBackend> _backend, const TerminalSize& _initialSize,
             const vector<string>& _command, int _inputFd, int _outputFd,
             int _pollIntervalMs);
  virtual ~PtySession();

  /**
   * @brief Allocates the pseudo-terminal and spawns the command.
   * @throws AllocationError; the session is left TERMINATED.
   */
  void start();

  /** @brief Relays data until the session is TERMINATED. */
  void run();

  /** @brief Asks a running session to stop.  Safe from any thread. */
  void shutdown();

  /**
   * @brief Asks every session in the process to stop.  Async-signal-safe,
   * meant to be called from a signal handler.
   */
  static void requestStop();
  /** @brief Clears a previous requestStop(). */
  static void clearStopRequest();

  State getState();

  /**
   * @brief Child exit status, -1 when the child was never reaped.  Meant to
   * be called once run() has returned.
   */
  int exitCode();

  const TerminalSize& getInitialSize() const { return initialSize; }
  const vector<string>& getCommand() const { return command; }

  static constexpr int BUF_SIZE = 16 * 1024;

 protected:
  void runPollLoop();
  void runThreadedLoop();

  /**
   * @brief Reads one chunk of child output and forwards it.
   * @return false when the master reached end-of-stream or failed.
   */
  bool pumpOutput();
  /** @brief Reads one chunk of embedder input and applies it. */
  void pumpInput();
  /** @brief Queues the clean data and the resizes, in order. */
  void applyEvents(const vector<InputEvent>& events);
  void applyResize(const TerminalSize& size);
  void queueForChild(const string& data);
  /**
   * @brief Writes queued input until the terminal would block, applying
   * queued resizes as they come up.
   */
  void writeQueuedInput();
  void relayOutput(const string& data);
  /** @brief Starts the idle clock when the decoder begins holding bytes. */
  void noteHeldInput();
  /**
   * @brief Releases an escape prefix held for a full poll interval, whether
   * or not the terminal has been busy meanwhile.
   */
  void flushIdleInput();
  /** @brief Forwards output still buffered in the master after exit. */
  void drainOutput();

  /** @brief Moves RUNNING to TERMINATING, logging why. */
  void beginTermination(const string& reason);
  /** @brief Checks the stop flag and the child, returns true if RUNNING. */
  bool keepRunning();
  /** @brief Closes the backend and asks the child to exit. */
  void finish();

  shared_ptr<PtyBackend> backend;
  TerminalSize initialSize;
  vector<string> command;
  int inputFd;
  int outputFd;
  int pollIntervalMs;
  ResizeSequenceDecoder decoder;
  ChildInputQueue inputQueue;
  /** @brief Cleared when embedder input reaches end-of-stream or fails. */
  bool inputOpen;
  /** @brief Cleared when the embedder stops accepting output. */
  bool outputOpen;
  /** @brief Set while the decoder holds a partial prefix. */
  bool holdingInput;
  std::chrono::steady_clock::time_point heldSince;

  std::recursive_mutex stateMutex;
  State state;

  static volatile sig_atomic_t stopRequested;
};
}  // namespace ptyhost

#endif  // __PTYHOST_PTY_SESSION_HPP__
