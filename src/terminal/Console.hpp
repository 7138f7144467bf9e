#ifndef __OT_CONSOLE__
#define __OT_CONSOLE__

#include "Headers.hpp"

namespace ot {
/**
 * @brief Abstract local console the interactive client runs on.
 */
class Console {
 public:
  virtual ~Console() {}

  /** @brief Current window size, forwarded to the remote pty. */
  virtual TerminalSize getTerminalSize() = 0;
  /** @brief Prepares the console before handing it to the remote shell. */
  virtual void setup() = 0;
  /** @brief Restores the console state. */
  virtual void teardown() = 0;
  /** @brief Descriptor operator keystrokes are read from. */
  virtual int getInputFd() = 0;
  /** @brief Descriptor remote output is written to. */
  virtual int getFd() = 0;

  /**
   * @brief Writes every byte of `s`, retrying on short writes and EINTR.
   */
  virtual void write(const string& s) {
    size_t written = 0;
    while (written < s.length()) {
      ssize_t rc = ::write(getFd(), s.data() + written, s.length() - written);
      if (rc < 0) {
        if (errno == EINTR || errno == EAGAIN) {
          continue;
        }
        throw std::runtime_error(string("Console write failed: ") +
                                 strerror(errno));
      }
      written += rc;
    }
  }
};
}  // namespace ot

#endif  // __OT_CONSOLE__
