#include "ConsoleTerminalEmulator.hpp"

namespace wt {
ConsoleTerminalEmulator::ConsoleTerminalEmulator()
    : raw(false), disposed(false) {
  if (isatty(STDIN_FILENO)) {
    FATAL_FAIL(tcgetattr(STDIN_FILENO, &terminalBackup));
  }
  lastTerminalInfo = getTerminalInfo();
}

ConsoleTerminalEmulator::~ConsoleTerminalEmulator() { dispose(); }

void ConsoleTerminalEmulator::write(const string& data) {
  size_t written = 0;
  while (written < data.size()) {
    ssize_t rc =
        ::write(STDOUT_FILENO, data.data() + written, data.size() - written);
    if (rc < 0) {
      if (errno == EAGAIN || errno == EINTR) {
        continue;
      }
      STERROR << "Cannot write to stdout: " << strerror(errno);
      throw std::runtime_error("Cannot write to stdout");
    }
    written += rc;
  }
}

void ConsoleTerminalEmulator::focus() {
  if (raw || disposed || !isatty(STDIN_FILENO)) {
    return;
  }
  termios terminalLocal;
  memcpy(&terminalLocal, &terminalBackup, sizeof(termios));
  cfmakeraw(&terminalLocal);
  FATAL_FAIL(tcsetattr(STDIN_FILENO, TCSANOW, &terminalLocal));
  raw = true;
}

void ConsoleTerminalEmulator::dispose() {
  if (disposed) {
    return;
  }
  disposed = true;
  dataHandler = TerminalDataHandler();
  resizeHandler = TerminalResizeHandler();
  if (raw) {
    tcsetattr(STDIN_FILENO, TCSANOW, &terminalBackup);
    raw = false;
  }
}

TerminalInfo ConsoleTerminalEmulator::getTerminalInfo() {
  TerminalInfo ti;
  winsize win;
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &win) == 0 && win.ws_col > 0) {
    ti.set_column(win.ws_col);
    ti.set_row(win.ws_row);
  } else {
    ti.set_column(80);
    ti.set_row(24);
  }
  return ti;
}

bool ConsoleTerminalEmulator::update(int timeoutMs) {
  if (disposed) {
    return false;
  }
  TerminalInfo ti = getTerminalInfo();
  if (ti != lastTerminalInfo) {
    lastTerminalInfo = ti;
    if (resizeHandler) {
      resizeHandler(ti.column(), ti.row());
    }
  }

  if (!waitOnFdData(STDIN_FILENO, timeoutMs)) {
    return true;
  }
  char buf[4096];
  ssize_t rc = ::read(STDIN_FILENO, buf, sizeof(buf));
  if (rc == 0) {
    return false;
  }
  if (rc < 0) {
    if (errno == EAGAIN || errno == EINTR) {
      return true;
    }
    STERROR << "Cannot read from stdin: " << strerror(errno);
    return false;
  }
  if (dataHandler) {
    dataHandler(string(buf, rc));
  }
  return true;
}
}  // namespace wt
