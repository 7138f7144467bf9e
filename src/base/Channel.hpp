#ifndef __OT_CHANNEL__
#define __OT_CHANNEL__

#include "Headers.hpp"

namespace ot {
/**
 * @brief Negative results returned by Channel::read/write.
 */
enum ChannelIoCode : ssize_t {
  CHANNEL_WOULD_BLOCK = -1,
  // The peer is still draining data we have not read yet
  CHANNEL_DRAINING = -2,
  // Broken pipe or connection reset
  CHANNEL_BROKEN = -3,
  CHANNEL_CLOSED = -4,
  CHANNEL_FAILED = -5,
};

inline bool isFatalChannelCode(ssize_t code) {
  return code == CHANNEL_BROKEN || code == CHANNEL_CLOSED;
}

inline const char* channelCodeToString(ssize_t code) {
  switch (code) {
    case CHANNEL_WOULD_BLOCK:
      return "would block";
    case CHANNEL_DRAINING:
      return "draining incoming flow";
    case CHANNEL_BROKEN:
      return "broken pipe";
    case CHANNEL_CLOSED:
      return "channel closed";
    case CHANNEL_FAILED:
      return "channel failure";
    default:
      return "ok";
  }
}

/**
 * @brief Abstract non-blocking sub-stream multiplexed over a transport.
 *
 * A channel is exclusively owned by one worker or one call site.
 */
class Channel {
 public:
  virtual ~Channel() {}

  /**
   * @brief Reads available remote output.
   * @return Bytes read, 0 when nothing is pending, or a ChannelIoCode.
   */
  virtual ssize_t read(char* buf, size_t count) = 0;

  /**
   * @brief Writes up to count bytes.
   * @return Bytes accepted by the transport or a ChannelIoCode.
   */
  virtual ssize_t write(const char* buf, size_t count) = 0;

  /** @brief True once the remote side has sent end-of-stream. */
  virtual bool eof() = 0;

  /** @brief Bytes the remote side currently accepts before adjusting. */
  virtual size_t writeWindow() = 0;

  /**
   * @brief Changes the pseudo-terminal size.
   * @throws ChannelError if the request fails.
   */
  virtual void resize(int cols, int rows) = 0;

  virtual void close() = 0;
};
}  // namespace ot

#endif  // __OT_CHANNEL__
