#ifdef WIN32
#include "ConPtyBackend.hpp"

namespace ptyhost {
namespace {
string quoteArgument(const string& arg) {
  if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == string::npos) {
    return arg;
  }
  string quoted = "\"";
  size_t backslashes = 0;
  for (char c : arg) {
    if (c == '\\') {
      backslashes++;
      continue;
    }
    if (c == '"') {
      // Escape the run of backslashes and the quote itself
      quoted.append(backslashes * 2 + 1, '\\');
    } else {
      quoted.append(backslashes, '\\');
    }
    backslashes = 0;
    quoted.push_back(c);
  }
  // Backslashes before the closing quote must be doubled
  quoted.append(backslashes * 2, '\\');
  quoted.push_back('"');
  return quoted;
}
}  // namespace

ConPtyBackend::ConPtyBackend()
    : pseudoConsole(NULL),
      inputWriteSide(INVALID_HANDLE_VALUE),
      outputReadSide(INVALID_HANDLE_VALUE) {}

ConPtyBackend::~ConPtyBackend() {
  lock_guard<std::mutex> guard(resizeMutex);
  releaseHandles();
}

string ConPtyBackend::buildCommandLine(const vector<string>& command) {
  string commandLine;
  for (const auto& arg : command) {
    if (!commandLine.empty()) {
      commandLine.push_back(' ');
    }
    commandLine.append(quoteArgument(arg));
  }
  return commandLine;
}

int64_t ConPtyBackend::allocate(const TerminalSize& initialSize,
                                const vector<string>& command) {
  if (pseudoConsole != NULL) {
    throw AllocationError("Pseudo console is already allocated");
  }
  if (command.empty()) {
    throw AllocationError("No command to run");
  }
  if (!initialSize.isValid() || initialSize.columns > SHRT_MAX ||
      initialSize.rows > SHRT_MAX) {
    std::ostringstream ss;
    ss << "Invalid initial terminal size " << initialSize;
    throw AllocationError(ss.str());
  }

  HANDLE inputReadSide = INVALID_HANDLE_VALUE;
  HANDLE outputWriteSide = INVALID_HANDLE_VALUE;
  if (!CreatePipe(&inputReadSide, &inputWriteSide, NULL, 0)) {
    throw AllocationError("CreatePipe failed: " + WinErrnoToString());
  }
  if (!CreatePipe(&outputReadSide, &outputWriteSide, NULL, 0)) {
    string error = WinErrnoToString();
    CloseHandle(inputReadSide);
    releaseHandles();
    throw AllocationError("CreatePipe failed: " + error);
  }

  COORD c;
  c.X = (SHORT)initialSize.columns;
  c.Y = (SHORT)initialSize.rows;
  HRESULT hr =
      CreatePseudoConsole(c, inputReadSide, outputWriteSide, 0, &pseudoConsole);
  // The pseudo console holds its own references to these
  CloseHandle(inputReadSide);
  CloseHandle(outputWriteSide);
  if (FAILED(hr)) {
    pseudoConsole = NULL;
    releaseHandles();
    std::ostringstream ss;
    ss << "CreatePseudoConsole failed: 0x" << std::hex << hr;
    throw AllocationError(ss.str());
  }

  SIZE_T bytesRequired = 0;
  InitializeProcThreadAttributeList(NULL, 1, 0, &bytesRequired);
  vector<BYTE> attributeBuffer(bytesRequired);
  auto attributeList =
      reinterpret_cast<LPPROC_THREAD_ATTRIBUTE_LIST>(attributeBuffer.data());
  if (!InitializeProcThreadAttributeList(attributeList, 1, 0,
                                         &bytesRequired)) {
    string error = WinErrnoToString();
    releaseHandles();
    throw AllocationError("InitializeProcThreadAttributeList failed: " + error);
  }
  if (!UpdateProcThreadAttribute(attributeList, 0,
                                 PROC_THREAD_ATTRIBUTE_PSEUDOCONSOLE,
                                 pseudoConsole, sizeof(pseudoConsole), NULL,
                                 NULL)) {
    string error = WinErrnoToString();
    DeleteProcThreadAttributeList(attributeList);
    releaseHandles();
    throw AllocationError("UpdateProcThreadAttribute failed: " + error);
  }

  STARTUPINFOEXA si;
  ZeroMemory(&si, sizeof(si));
  si.StartupInfo.cb = sizeof(STARTUPINFOEXA);
  si.lpAttributeList = attributeList;

  // CreateProcess may modify the command line buffer in place
  string commandLine = buildCommandLine(command);
  vector<char> commandLineMutable(commandLine.begin(), commandLine.end());
  commandLineMutable.push_back('\0');

  PROCESS_INFORMATION pi;
  ZeroMemory(&pi, sizeof(pi));
  BOOL created = CreateProcessA(NULL, commandLineMutable.data(), NULL, NULL,
                                FALSE, EXTENDED_STARTUPINFO_PRESENT, NULL,
                                NULL, &si.StartupInfo, &pi);
  string createError = created ? string() : WinErrnoToString();
  DeleteProcThreadAttributeList(attributeList);
  if (!created) {
    releaseHandles();
    throw AllocationError("Cannot execute " + command[0] + ": " + createError);
  }
  CloseHandle(pi.hThread);

  {
    lock_guard<std::mutex> guard(resizeMutex);
    size = initialSize;
  }
  supervisor.reset(new ProcessSupervisor(pi.hProcess, pi.dwProcessId));
  LOG(INFO) << "Pseudo console opened for child " << pi.dwProcessId << " ("
            << commandLine << ") at " << initialSize;
  return pi.dwProcessId;
}

int ConPtyBackend::read(char* buf, int count) {
  if (outputReadSide == INVALID_HANDLE_VALUE) {
    errno = EBADF;
    return -1;
  }
  DWORD bytesRead = 0;
  if (!ReadFile(outputReadSide, buf, (DWORD)count, &bytesRead, NULL)) {
    DWORD error = GetLastError();
    if (error == ERROR_BROKEN_PIPE || error == ERROR_OPERATION_ABORTED) {
      return 0;
    }
    errno = EIO;
    return -1;
  }
  return (int)bytesRead;
}

void ConPtyBackend::write(const string& data) {
  if (inputWriteSide == INVALID_HANDLE_VALUE) {
    throw std::runtime_error("Write to a closed pseudo console");
  }
  size_t bytesWritten = 0;
  while (bytesWritten < data.length()) {
    DWORD written = 0;
    if (!WriteFile(inputWriteSide, data.data() + bytesWritten,
                   (DWORD)(data.length() - bytesWritten), &written, NULL)) {
      throw std::runtime_error("Cannot write to pseudo console: " +
                               WinErrnoToString());
    }
    bytesWritten += written;
  }
}

void ConPtyBackend::resize(const TerminalSize& newSize) {
  lock_guard<std::mutex> guard(resizeMutex);
  if (!newSize.isValid() || newSize.columns > SHRT_MAX ||
      newSize.rows > SHRT_MAX) {
    std::ostringstream ss;
    ss << "Invalid terminal size " << newSize;
    throw ResizeError(ss.str());
  }
  if (pseudoConsole == NULL) {
    throw ResizeError("Resize of a closed pseudo console");
  }
  COORD c;
  c.X = (SHORT)newSize.columns;
  c.Y = (SHORT)newSize.rows;
  HRESULT hr = ResizePseudoConsole(pseudoConsole, c);
  if (FAILED(hr)) {
    std::ostringstream ss;
    ss << "ResizePseudoConsole failed: 0x" << std::hex << hr;
    throw ResizeError(ss.str());
  }
  size = newSize;
  VLOG(1) << "Terminal resized to " << newSize;
}

TerminalSize ConPtyBackend::getSize() {
  lock_guard<std::mutex> guard(resizeMutex);
  return size;
}

bool ConPtyBackend::isAlive() {
  if (!supervisor) {
    return false;
  }
  return supervisor->isAlive();
}

void ConPtyBackend::terminate() {
  if (supervisor) {
    supervisor->terminate();
  }
}

void ConPtyBackend::close() {
  lock_guard<std::mutex> guard(resizeMutex);
  // Closing the pseudo console lets a blocked reader drain the final output
  // and then see a broken pipe.  The read side itself stays open until
  // destruction so that reader never touches a closed handle.
  if (pseudoConsole != NULL) {
    VLOG(1) << "Closing pseudo console";
    ClosePseudoConsole(pseudoConsole);
    pseudoConsole = NULL;
  }
  if (inputWriteSide != INVALID_HANDLE_VALUE) {
    CloseHandle(inputWriteSide);
    inputWriteSide = INVALID_HANDLE_VALUE;
  }
}

void ConPtyBackend::releaseHandles() {
  if (pseudoConsole != NULL) {
    ClosePseudoConsole(pseudoConsole);
    pseudoConsole = NULL;
  }
  if (inputWriteSide != INVALID_HANDLE_VALUE) {
    CloseHandle(inputWriteSide);
    inputWriteSide = INVALID_HANDLE_VALUE;
  }
  if (outputReadSide != INVALID_HANDLE_VALUE) {
    CloseHandle(outputReadSide);
    outputReadSide = INVALID_HANDLE_VALUE;
  }
}

int ConPtyBackend::exitCode() {
  if (!supervisor) {
    return -1;
  }
  return supervisor->exitCode();
}
}  // namespace ptyhost
#endif
