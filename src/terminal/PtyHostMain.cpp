#include "CommandLine.hpp"
#include "ConsoleMode.hpp"
#include "LogHandler.hpp"
#include "PtySession.hpp"
#ifdef WIN32
#include "ConPtyBackend.hpp"
#else
#include "PosixPtyBackend.hpp"
#endif

using namespace ptyhost;

namespace {
void StopSignalHandler(int signum) { PtySession::requestStop(); }

void InstallSignalHandlers() {
#ifdef WIN32
  ::signal(SIGINT, StopSignalHandler);
  ::signal(SIGTERM, StopSignalHandler);
#else
  // No SA_RESTART: the signal has to interrupt select() so the loop sees the
  // stop request right away
  struct sigaction action;
  memset(&action, 0, sizeof(action));
  action.sa_handler = StopSignalHandler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  FATAL_FAIL(sigaction(SIGINT, &action, NULL));
  FATAL_FAIL(sigaction(SIGTERM, &action, NULL));
  FATAL_FAIL(sigaction(SIGHUP, &action, NULL));
  // A vanished embedder shows up as EPIPE on write instead
  ::signal(SIGPIPE, SIG_IGN);
#endif
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  CommandLine commandLine;
  HostOptions hostOptions;
  try {
    hostOptions = commandLine.parse(argc, argv);
  } catch (const ArgumentError& ae) {
    // stdout is reserved for terminal data, the operator reads stderr
    cerr << "Error: " << ae.what() << "\n\n" << commandLine.help() << endl;
    return 1;
  }

  if (hostOptions.help) {
    CLOG(INFO, "stdout") << commandLine.help() << endl;
    return 0;
  }
  if (hostOptions.version) {
    CLOG(INFO, "stdout") << "ptyhost version " << PTYHOST_VERSION << endl;
    return 0;
  }

  el::Loggers::setVerboseLevel(hostOptions.verbose);
  LogHandler::setupLogFiles(&defaultConf, hostOptions.logDirectory, "ptyhost",
                            hostOptions.logToStdout);
  // Reconfigure default logger to apply settings above
  el::Loggers::reconfigureLogger("default", defaultConf);
  el::Helpers::setThreadName("ptyhost-main");
  // Install log rotation callback
  el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

  HandleTerminate();
  InstallSignalHandlers();

#ifdef WIN32
  _setmode(_fileno(stdin), _O_BINARY);
  _setmode(_fileno(stdout), _O_BINARY);
  shared_ptr<PtyBackend> backend(new ConPtyBackend());
#else
  shared_ptr<PtyBackend> backend(new PosixPtyBackend());
#endif

  PtySession session(backend, hostOptions.initialSize, hostOptions.command,
                     STDIN_FILENO, STDOUT_FILENO, hostOptions.pollIntervalMs);
  try {
    session.start();
  } catch (const AllocationError& ae) {
    LOG(ERROR) << "Cannot start session: " << ae.what();
    cerr << "Error: " << ae.what() << endl;
    el::Helpers::uninstallPreRollOutCallback();
    return 1;
  }

  ConsoleMode consoleMode(STDIN_FILENO);
  consoleMode.setup();
  session.run();
  consoleMode.teardown();

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();

  int status = session.exitCode();
  return status >= 0 ? status : 0;
}
