#include "ProcessSupervisor.hpp"

namespace ptyhost {
#ifdef WIN32
ProcessSupervisor::ProcessSupervisor(HANDLE _process, DWORD _pid)
    : process(_process), pid(_pid), exited(false), exitStatus(-1) {}

ProcessSupervisor::~ProcessSupervisor() {
  if (process != NULL) {
    CloseHandle(process);
  }
}

bool ProcessSupervisor::isAlive() {
  if (exited) {
    return false;
  }
  if (WaitForSingleObject(process, 0) != WAIT_OBJECT_0) {
    return true;
  }
  DWORD code = 0;
  if (GetExitCodeProcess(process, &code)) {
    exitStatus = (int)code;
  }
  exited = true;
  LOG(INFO) << "Child " << pid << " exited with status " << exitStatus;
  return false;
}

void ProcessSupervisor::terminate() {
  if (!isAlive()) {
    return;
  }
  LOG(INFO) << "Terminating child " << pid;
  if (!TerminateProcess(process, 1)) {
    LOG(WARNING) << "Could not terminate child " << pid << ": "
                 << WinErrnoToString();
  }
}
#else
ProcessSupervisor::ProcessSupervisor(pid_t _pid)
    : pid(_pid), exited(false), exitStatus(-1) {}

ProcessSupervisor::~ProcessSupervisor() {}

bool ProcessSupervisor::isAlive() {
  if (exited) {
    return false;
  }
  int status = 0;
  pid_t rc;
  do {
    rc = waitpid(pid, &status, WNOHANG);
  } while (rc == -1 && errno == EINTR);

  if (rc == 0) {
    return true;
  }
  if (rc == -1) {
    // ECHILD: someone else reaped it, there is no status to report
    LOG(WARNING) << "waitpid on child " << pid << " failed: "
                 << strerror(errno);
    exited = true;
    return false;
  }
  if (WIFEXITED(status)) {
    exitStatus = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exitStatus = 128 + WTERMSIG(status);
  }
  exited = true;
  LOG(INFO) << "Child " << pid << " exited with status " << exitStatus;
  return false;
}

void ProcessSupervisor::terminate() {
  if (!isAlive()) {
    return;
  }
  LOG(INFO) << "Sending SIGTERM to child " << pid;
  if (::kill(pid, SIGTERM) == -1 && errno != ESRCH) {
    LOG(WARNING) << "Could not signal child " << pid << ": "
                 << strerror(errno);
  }
}
#endif
}  // namespace ptyhost
