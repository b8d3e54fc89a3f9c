#ifndef __WT_CONSOLE_TERMINAL_EMULATOR__
#define __WT_CONSOLE_TERMINAL_EMULATOR__

#include "Headers.hpp"
#include "TerminalEmulator.hpp"

namespace wt {
/**
 * @brief Uses the local tty as the terminal surface: stdin in raw mode for
 * input, stdout for output, TIOCGWINSZ for the window size.
 */
class ConsoleTerminalEmulator : public TerminalEmulator {
 public:
  ConsoleTerminalEmulator();
  virtual ~ConsoleTerminalEmulator();

  virtual void write(const string& data);
  virtual void setDataHandler(TerminalDataHandler handler) {
    dataHandler = handler;
  }
  virtual void setResizeHandler(TerminalResizeHandler handler) {
    resizeHandler = handler;
  }
  /** @brief Switches stdin to raw mode. */
  virtual void focus();
  /** @brief Restores the saved tty state. */
  virtual void dispose();
  virtual TerminalInfo getTerminalInfo();

  /**
   * @brief Reads pending keystrokes and checks the window size, waiting at
   * most `timeoutMs` for input.  Returns false once stdin is closed.
   */
  bool update(int timeoutMs);

 protected:
  termios terminalBackup;
  bool raw;
  bool disposed;
  TerminalInfo lastTerminalInfo;
  TerminalDataHandler dataHandler;
  TerminalResizeHandler resizeHandler;
};
}  // namespace wt

#endif  // __WT_CONSOLE_TERMINAL_EMULATOR__
