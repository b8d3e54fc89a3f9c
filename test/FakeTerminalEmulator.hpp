#ifndef __WT_FAKE_TERMINAL_EMULATOR__
#define __WT_FAKE_TERMINAL_EMULATOR__

#include "TerminalEmulator.hpp"

namespace wt {
class FakeTerminalEmulator : public TerminalEmulator {
 public:
  FakeTerminalEmulator() : focused(false), disposeCount(0) {
    info.set_column(120);
    info.set_row(40);
  }

  virtual void write(const string& data) { output += data; }
  virtual void setDataHandler(TerminalDataHandler handler) {
    dataHandler = handler;
  }
  virtual void setResizeHandler(TerminalResizeHandler handler) {
    resizeHandler = handler;
  }
  virtual void focus() { focused = true; }
  virtual void dispose() { disposeCount++; }
  virtual TerminalInfo getTerminalInfo() { return info; }

  void type(const string& keys) {
    if (dataHandler) dataHandler(keys);
  }
  void resize(int cols, int rows) {
    info.set_column(cols);
    info.set_row(rows);
    if (resizeHandler) resizeHandler(cols, rows);
  }

  string output;
  bool focused;
  int disposeCount;
  TerminalInfo info;
  TerminalDataHandler dataHandler;
  TerminalResizeHandler resizeHandler;
};
}  // namespace wt

#endif  // __WT_FAKE_TERMINAL_EMULATOR__
