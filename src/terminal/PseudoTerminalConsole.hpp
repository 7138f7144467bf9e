#ifndef __OT_PSEUDO_TERMINAL_CONSOLE__
#define __OT_PSEUDO_TERMINAL_CONSOLE__

#include "Console.hpp"

namespace ot {
/**
 * @brief Puts the controlling terminal into raw mode for an interactive
 * remote shell.
 */
class PseudoTerminalConsole : public Console {
 public:
  PseudoTerminalConsole() {
    termios terminal_local;
    tcgetattr(0, &terminal_local);
    memcpy(&terminal_backup, &terminal_local, sizeof(struct termios));
  }

  virtual ~PseudoTerminalConsole() {}

  /** @brief Switches stdin/out to raw mode. */
  virtual void setup() {
    termios terminal_local;
    tcgetattr(0, &terminal_local);
    memcpy(&terminal_backup, &terminal_local, sizeof(struct termios));
    cfmakeraw(&terminal_local);
    tcsetattr(0, TCSANOW, &terminal_local);
  }

  /** @brief Restores the terminal state saved by setup(). */
  virtual void teardown() { tcsetattr(0, TCSANOW, &terminal_backup); }

  virtual TerminalSize getTerminalSize() {
    winsize win;
    TerminalSize ts;
    if (ioctl(1, TIOCGWINSZ, &win) < 0 || win.ws_col == 0) {
      ts.set_column(80);
      ts.set_row(24);
      return ts;
    }
    ts.set_row(win.ws_row);
    ts.set_column(win.ws_col);
    return ts;
  }

  virtual int getInputFd() { return STDIN_FILENO; }

  virtual int getFd() { return STDOUT_FILENO; }

 protected:
  termios terminal_backup;
};
}  // namespace ot

#endif  // __OT_PSEUDO_TERMINAL_CONSOLE__
