#ifndef __OT_TRANSPORT__
#define __OT_TRANSPORT__

#include "Channel.hpp"
#include "CredentialVault.hpp"
#include "Headers.hpp"

namespace ot {
/**
 * @brief Last-used dial parameters, kept to redial and to create disposable
 * transports. The credential stays sealed.
 */
struct ConnectionParams {
  TransportEndpoint endpoint;
  shared_ptr<CredentialVault> credential;
};

/**
 * @brief One authenticated, encrypted connection to a remote host.
 */
class Transport {
 public:
  virtual ~Transport() {}

  virtual const TransportEndpoint& getEndpoint() const = 0;

  /** @brief Returns false once the underlying connection is known dead. */
  virtual bool isAlive() = 0;

  /** @brief Closes the connection, sending `reason` to the peer. */
  virtual void disconnect(const string& reason) = 0;
};

/**
 * @brief Transport whose channels are used with blocking round trips.
 */
class BlockingTransport : public Transport {
 public:
  /**
   * @brief Runs one command to completion on a fresh channel.
   * @return stdout followed by stderr, plus the exit status if reported.
   * @throws IoError if the connection fails mid-command.
   */
  virtual CommandResult execute(const string& command) = 0;

  /**
   * @brief Lists a remote directory over a file-transfer channel.
   * @throws ChannelError if the directory cannot be opened.
   */
  virtual vector<RemoteFileInfo> listDirectory(const string& path) = 0;
};

/**
 * @brief Transport in non-blocking mode, hosting interactive terminals.
 *
 * There is no way back to blocking mode: flipping the mode with live
 * channels makes their reads hang.
 */
class NonBlockingTransport : public Transport {
 public:
  /**
   * @brief Opens a channel with a pseudo-terminal and a login shell.
   * @throws ChannelError if any step fails.
   */
  virtual shared_ptr<Channel> openTerminalChannel(int cols, int rows) = 0;
};

/**
 * @brief Creates transports. Abstract so tests can script the remote side.
 */
class TransportFactory {
 public:
  virtual ~TransportFactory() {}

  /**
   * @throws ConnectionError or AuthenticationError.
   */
  virtual shared_ptr<BlockingTransport> connect(
      const ConnectionParams& params) = 0;

  /**
   * @brief Switches a connected transport to non-blocking mode. `transport`
   * must not be used afterwards.
   */
  virtual shared_ptr<NonBlockingTransport> toNonBlocking(
      shared_ptr<BlockingTransport> transport) = 0;
};
}  // namespace ot

#endif  // __OT_TRANSPORT__
