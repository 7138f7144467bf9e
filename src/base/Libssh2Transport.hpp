#ifndef __OT_LIBSSH2_TRANSPORT__
#define __OT_LIBSSH2_TRANSPORT__

#include <libssh2.h>
#include <libssh2_sftp.h>

#include "Headers.hpp"
#include "OpsConfig.hpp"
#include "Transport.hpp"

namespace ot {
/**
 * @brief Owns one TCP socket and the libssh2 session running over it.
 *
 * libssh2 sessions are not thread safe: every call on the session or on one
 * of its channels happens under `ioMutex`.
 */
class Libssh2Session {
 public:
  /**
   * @brief Resolves, connects (IPv4 first), handshakes and authenticates.
   * @throws ConnectionError or AuthenticationError.
   */
  static shared_ptr<Libssh2Session> dial(const ConnectionParams& params,
                                         std::chrono::seconds connectTimeout);

  Libssh2Session(int _socketFd, LIBSSH2_SESSION* _session,
                 const TransportEndpoint& _endpoint);
  ~Libssh2Session();

  /** @brief Caller must hold ioMutex. NULL once disconnected. */
  LIBSSH2_SESSION* get() { return session; }

  mutex& getIoMutex() { return ioMutex; }

  const TransportEndpoint& getEndpoint() const { return endpoint; }

  const string& getId() const { return id; }

  /** @brief Caller must hold ioMutex. */
  string lastErrorLocked();

  /**
   * @brief Caller must hold ioMutex. Marks the session dead if `rc` is a
   * socket level failure.
   * @return true if `rc` was a socket level failure.
   */
  bool checkSocketErrorLocked(int rc);

  /** @brief Probes the connection with a keepalive. */
  bool isAlive();

  void setBlocking(bool blocking);

  void disconnect(const string& reason);

 protected:
  void disconnectLocked(const string& reason);

  mutex ioMutex;
  int socketFd;
  LIBSSH2_SESSION* session;
  TransportEndpoint endpoint;
  string id;
  std::atomic<bool> alive;
};

/**
 * @brief Non-blocking pty channel driven by a TerminalWorker.
 */
class Libssh2Channel : public Channel {
 public:
  Libssh2Channel(shared_ptr<Libssh2Session> _session,
                 LIBSSH2_CHANNEL* _channel);
  virtual ~Libssh2Channel();

  virtual ssize_t read(char* buf, size_t count);
  virtual ssize_t write(const char* buf, size_t count);
  virtual bool eof();
  virtual size_t writeWindow();
  virtual void resize(int cols, int rows);
  virtual void close();

 protected:
  ssize_t mapErrorLocked(ssize_t rc);

  shared_ptr<Libssh2Session> session;
  LIBSSH2_CHANNEL* channel;
};

class Libssh2BlockingTransport : public BlockingTransport {
 public:
  explicit Libssh2BlockingTransport(shared_ptr<Libssh2Session> _session);
  virtual ~Libssh2BlockingTransport();

  virtual const TransportEndpoint& getEndpoint() const { return endpoint; }
  virtual bool isAlive();
  virtual void disconnect(const string& reason);
  virtual CommandResult execute(const string& command);
  virtual vector<RemoteFileInfo> listDirectory(const string& path);

  /** @brief Hands the session over, leaving this transport unusable. */
  shared_ptr<Libssh2Session> release();

 protected:
  CommandResult runLocked(LIBSSH2_SESSION* s, const string& shellCommand);
  string readStreamLocked(LIBSSH2_SESSION* s, LIBSSH2_CHANNEL* channel,
                          int streamId);
  shared_ptr<Libssh2Session> checkedSession();

  mutex transportMutex;
  shared_ptr<Libssh2Session> session;
  TransportEndpoint endpoint;
};

class Libssh2NonBlockingTransport : public NonBlockingTransport {
 public:
  Libssh2NonBlockingTransport(shared_ptr<Libssh2Session> _session,
                              const TerminalConfig& _config);
  virtual ~Libssh2NonBlockingTransport();

  virtual const TransportEndpoint& getEndpoint() const {
    return session->getEndpoint();
  }
  virtual bool isAlive();
  virtual void disconnect(const string& reason);
  virtual shared_ptr<Channel> openTerminalChannel(int cols, int rows);

 protected:
  shared_ptr<Libssh2Session> session;
  TerminalConfig config;
};

class Libssh2TransportFactory : public TransportFactory {
 public:
  Libssh2TransportFactory(const ConnectionConfig& _connectionConfig,
                          const TerminalConfig& _terminalConfig);

  virtual shared_ptr<BlockingTransport> connect(const ConnectionParams& params);
  virtual shared_ptr<NonBlockingTransport> toNonBlocking(
      shared_ptr<BlockingTransport> transport);

 protected:
  ConnectionConfig connectionConfig;
  TerminalConfig terminalConfig;
};
}  // namespace ot

#endif  // __OT_LIBSSH2_TRANSPORT__
