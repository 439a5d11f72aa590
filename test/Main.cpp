#define CATCH_CONFIG_RUNNER

#include <cstring>

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace ptyhost;

int main(int argc, char **argv) {
  srand(1);

  bool listOnly = false;
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--list-tests") == 0 || strcmp(argv[i], "-l") == 0) {
      listOnly = true;
      break;
    }
  }

  // Setup easylogging configurations
  el::Configurations defaultConf =
      ptyhost::LogHandler::setupLogHandler(&argc, &argv);
  ptyhost::LogHandler::setupStdoutLogger();
  // el::Loggers::setVerboseLevel(9);

  ptyhost::HandleTerminate();

#ifndef WIN32
  // Tests write into pipes whose readers may already be gone
  ::signal(SIGPIPE, SIG_IGN);
#endif

  string logDirectoryPattern =
      GetTempDirectory() + string("ptyhost_test_XXXXXXXX");
  string logDirectory = string(mkdtemp(&logDirectoryPattern[0]));
  if (!listOnly) {
    CLOG(INFO, "stdout") << "Writing log to " << logDirectory << endl;
  }
  ptyhost::LogHandler::setupLogFiles(&defaultConf, logDirectory, "log", false,
                                     true);

  // Reconfigure default logger to apply settings above
  el::Loggers::reconfigureLogger("default", defaultConf);

  int result = Catch::Session().run(argc, argv);

  fs::remove_all(logDirectory);
  return result;
}
