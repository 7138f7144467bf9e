#ifndef __OT_ERRORS__
#define __OT_ERRORS__

#include "Headers.hpp"

namespace ot {
/**
 * @brief DNS, TCP or handshake failure while dialing a remote host.
 */
class ConnectionError : public std::runtime_error {
 public:
  explicit ConnectionError(const string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief The remote host rejected the supplied credential. Never retried.
 */
class AuthenticationError : public ConnectionError {
 public:
  explicit AuthenticationError(const string& msg) : ConnectionError(msg) {}
};

/**
 * @brief A channel is missing, not writable, stale or at end of stream.
 */
class ChannelError : public std::runtime_error {
 public:
  explicit ChannelError(const string& msg) : std::runtime_error(msg) {}
};

enum class FlowControlErrorKind {
  BUFFER_OVERFLOW = 0,
  WINDOW_EXHAUSTED = 1,
};

/**
 * @brief Recoverable backpressure failure, the caller may retry later.
 */
class FlowControlError : public std::runtime_error {
 public:
  FlowControlError(FlowControlErrorKind _kind, const string& msg)
      : std::runtime_error(msg), kind(_kind) {}

  FlowControlErrorKind getKind() const { return kind; }

 private:
  FlowControlErrorKind kind;
};

/**
 * @brief Broken pipe, reset or closed channel. Fatal for the transport.
 */
class IoError : public std::runtime_error {
 public:
  explicit IoError(const string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief A command failed the safety screen and was never sent.
 */
class CommandRejected : public std::runtime_error {
 public:
  explicit CommandRejected(const string& msg) : std::runtime_error(msg) {}
};
}  // namespace ot

#endif  // __OT_ERRORS__
