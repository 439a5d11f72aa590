#ifndef WIN32
#include "ProcessSupervisor.hpp"

#include "TestHeaders.hpp"

using namespace ptyhost;

namespace {
bool waitForExit(ProcessSupervisor& supervisor) {
  for (int a = 0; a < 1000; a++) {
    if (!supervisor.isAlive()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return false;
}
}  // namespace

TEST_CASE("Exit status of a child", "[ProcessSupervisor]") {
  pid_t pid = fork();
  REQUIRE(pid >= 0);
  if (pid == 0) {
    _exit(5);
  }
  ProcessSupervisor supervisor(pid);
  REQUIRE(supervisor.getPid() == pid);
  REQUIRE(supervisor.exitCode() == -1);
  REQUIRE(waitForExit(supervisor));
  REQUIRE(supervisor.hasExited());
  REQUIRE(supervisor.exitCode() == 5);
  // Once reaped, the answer does not change
  REQUIRE_FALSE(supervisor.isAlive());
  REQUIRE(supervisor.exitCode() == 5);
}

TEST_CASE("Terminate a running child", "[ProcessSupervisor]") {
  pid_t pid = fork();
  REQUIRE(pid >= 0);
  if (pid == 0) {
    while (true) {
      pause();
    }
  }
  ProcessSupervisor supervisor(pid);
  REQUIRE(supervisor.isAlive());
  supervisor.terminate();
  REQUIRE(waitForExit(supervisor));
  REQUIRE(supervisor.exitCode() == 128 + SIGTERM);
  REQUIRE_NOTHROW(supervisor.terminate());
}

TEST_CASE("Child reaped elsewhere", "[ProcessSupervisor]") {
  pid_t pid = fork();
  REQUIRE(pid >= 0);
  if (pid == 0) {
    _exit(0);
  }
  int status;
  REQUIRE(waitpid(pid, &status, 0) == pid);
  ProcessSupervisor supervisor(pid);
  REQUIRE_FALSE(supervisor.isAlive());
  REQUIRE(supervisor.hasExited());
  REQUIRE(supervisor.exitCode() == -1);
}
#endif
