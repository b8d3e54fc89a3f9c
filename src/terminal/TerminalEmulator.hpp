#ifndef __WT_TERMINAL_EMULATOR__
#define __WT_TERMINAL_EMULATOR__

#include "Headers.hpp"

namespace wt {
typedef std::function<void(const string&)> TerminalDataHandler;
typedef std::function<void(int cols, int rows)> TerminalResizeHandler;

/**
 * @brief The rendering surface of a terminal session.  Output bytes are
 * written to it verbatim; it reports keystrokes and size changes back.
 */
class TerminalEmulator {
 public:
  virtual ~TerminalEmulator() {}

  virtual void write(const string& data) = 0;
  virtual void setDataHandler(TerminalDataHandler handler) = 0;
  virtual void setResizeHandler(TerminalResizeHandler handler) = 0;
  virtual void focus() = 0;
  /** @brief Releases the surface.  No handler fires afterwards. */
  virtual void dispose() = 0;
  virtual TerminalInfo getTerminalInfo() = 0;
};
}  // namespace wt

#endif  // __WT_TERMINAL_EMULATOR__
