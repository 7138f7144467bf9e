#include "Libssh2Transport.hpp"

#include "Errors.hpp"
#include "RetryUtils.hpp"
#include "ShellUtils.hpp"

namespace ot {
namespace {
const std::chrono::milliseconds EAGAIN_PAUSE(10);
const std::chrono::seconds CHANNEL_SETUP_TIMEOUT(10);
const int KEEPALIVE_INTERVAL_SECONDS = 15;

std::once_flag libssh2InitFlag;

int connectWithTimeout(const addrinfo* address,
                       std::chrono::seconds connectTimeout) {
  int fd = ::socket(address->ai_family, address->ai_socktype,
                    address->ai_protocol);
  if (fd < 0) {
    return -1;
  }
  int flags = fcntl(fd, F_GETFL, 0);
  FATAL_FAIL(fcntl(fd, F_SETFL, flags | O_NONBLOCK));

  int rc = ::connect(fd, address->ai_addr, address->ai_addrlen);
  if (rc < 0 && errno == EINPROGRESS) {
    fd_set writeSet;
    FD_ZERO(&writeSet);
    FD_SET(fd, &writeSet);
    timeval tv;
    tv.tv_sec = connectTimeout.count();
    tv.tv_usec = 0;
    rc = select(fd + 1, NULL, &writeSet, NULL, &tv);
    if (rc <= 0) {
      VLOG(1) << "Connect timed out or failed: " << strerror(errno);
      ::close(fd);
      return -1;
    }
    int socketError = 0;
    socklen_t len = sizeof(socketError);
    getsockopt(fd, SOL_SOCKET, SO_ERROR, &socketError, &len);
    if (socketError) {
      VLOG(1) << "Connect failed: " << strerror(socketError);
      ::close(fd);
      return -1;
    }
  } else if (rc < 0) {
    VLOG(1) << "Connect failed: " << strerror(errno);
    ::close(fd);
    return -1;
  }

  FATAL_FAIL(fcntl(fd, F_SETFL, flags));
  int flag = 1;
  FATAL_FAIL(setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (char*)&flag,
                        sizeof(int)));
  return fd;
}

string remoteChildPath(const string& parent, const string& name) {
  if (!parent.empty() && parent.back() == '/') {
    return parent + name;
  }
  return parent + "/" + name;
}
}  // namespace

shared_ptr<Libssh2Session> Libssh2Session::dial(
    const ConnectionParams& params, std::chrono::seconds connectTimeout) {
  const TransportEndpoint& endpoint = params.endpoint;
  addrinfo hints;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* results = NULL;
  string port = to_string(endpoint.port());
  int rc = getaddrinfo(endpoint.name().c_str(), port.c_str(), &hints, &results);
  if (rc != 0) {
    throw ConnectionError("Could not resolve " + endpoint.name() + ": " +
                          gai_strerror(rc));
  }
  vector<addrinfo*> candidates;
  for (addrinfo* p = results; p != NULL; p = p->ai_next) {
    candidates.push_back(p);
  }
  std::stable_partition(candidates.begin(), candidates.end(),
                        [](addrinfo* p) { return p->ai_family == AF_INET; });

  int fd = -1;
  for (auto candidate : candidates) {
    fd = connectWithTimeout(candidate, connectTimeout);
    if (fd >= 0) {
      break;
    }
  }
  freeaddrinfo(results);
  if (fd < 0) {
    throw ConnectionError("Could not connect to " + endpoint.name() + ":" +
                          port);
  }

  LIBSSH2_SESSION* rawSession = libssh2_session_init();
  if (!rawSession) {
    ::close(fd);
    throw ConnectionError("Could not allocate ssh session");
  }
  auto session = make_shared<Libssh2Session>(fd, rawSession, endpoint);

  lock_guard<mutex> guard(session->ioMutex);
  libssh2_session_set_blocking(rawSession, 1);
  libssh2_session_set_timeout(
      rawSession,
      std::chrono::duration_cast<std::chrono::milliseconds>(connectTimeout)
          .count());
  rc = libssh2_session_handshake(rawSession, fd);
  if (rc) {
    string error = session->lastErrorLocked();
    session->disconnectLocked("Handshake failed");
    throw ConnectionError("SSH handshake with " + endpoint.name() +
                          " failed: " + error);
  }

  string password = params.credential->reveal();
  rc = libssh2_userauth_password(rawSession, endpoint.principal().c_str(),
                                 password.c_str());
  CredentialVault::wipeString(&password);
  if (rc) {
    string error = session->lastErrorLocked();
    session->disconnectLocked("Authentication failed");
    throw AuthenticationError("Authentication as " + endpoint.principal() +
                              " failed: " + error);
  }
  // Commands may legitimately run for a long time
  libssh2_session_set_timeout(rawSession, 0);
  libssh2_keepalive_config(rawSession, 1, KEEPALIVE_INTERVAL_SECONDS);
  LOG(INFO) << "Connected to " << endpoint << " (session " << session->id
            << ")";
  return session;
}

Libssh2Session::Libssh2Session(int _socketFd, LIBSSH2_SESSION* _session,
                               const TransportEndpoint& _endpoint)
    : socketFd(_socketFd),
      session(_session),
      endpoint(_endpoint),
      id(sole::uuid4().str()),
      alive(true) {}

Libssh2Session::~Libssh2Session() { disconnect("Session closed"); }

string Libssh2Session::lastErrorLocked() {
  if (!session) {
    return "session closed";
  }
  char* message = NULL;
  int length = 0;
  libssh2_session_last_error(session, &message, &length, 0);
  if (!message) {
    return "unknown error";
  }
  return string(message, length);
}

bool Libssh2Session::checkSocketErrorLocked(int rc) {
  switch (rc) {
    case LIBSSH2_ERROR_SOCKET_SEND:
    case LIBSSH2_ERROR_SOCKET_RECV:
    case LIBSSH2_ERROR_SOCKET_DISCONNECT:
    case LIBSSH2_ERROR_SOCKET_TIMEOUT:
      if (alive) {
        LOG(WARNING) << "Session " << id << " to " << endpoint
                     << " lost: " << lastErrorLocked();
      }
      alive = false;
      return true;
    default:
      return false;
  }
}

bool Libssh2Session::isAlive() {
  lock_guard<mutex> guard(ioMutex);
  if (!alive || !session) {
    return false;
  }
  int secondsToNext = 0;
  int rc = libssh2_keepalive_send(session, &secondsToNext);
  if (rc && rc != LIBSSH2_ERROR_EAGAIN) {
    checkSocketErrorLocked(rc);
    alive = false;
  }
  return alive;
}

void Libssh2Session::setBlocking(bool blocking) {
  lock_guard<mutex> guard(ioMutex);
  if (session) {
    libssh2_session_set_blocking(session, blocking ? 1 : 0);
  }
}

void Libssh2Session::disconnect(const string& reason) {
  lock_guard<mutex> guard(ioMutex);
  disconnectLocked(reason);
}

void Libssh2Session::disconnectLocked(const string& reason) {
  if (session) {
    // Blocking so the disconnect message is actually sent
    libssh2_session_set_blocking(session, 1);
    if (alive) {
      libssh2_session_disconnect(session, reason.c_str());
    }
    libssh2_session_free(session);
    session = NULL;
    VLOG(1) << "Session " << id << " disconnected: " << reason;
  }
  if (socketFd >= 0) {
    ::close(socketFd);
    socketFd = -1;
  }
  alive = false;
}

Libssh2Channel::Libssh2Channel(shared_ptr<Libssh2Session> _session,
                               LIBSSH2_CHANNEL* _channel)
    : session(_session), channel(_channel) {}

Libssh2Channel::~Libssh2Channel() { close(); }

ssize_t Libssh2Channel::read(char* buf, size_t count) {
  lock_guard<mutex> guard(session->getIoMutex());
  if (!channel || !session->get()) {
    return CHANNEL_CLOSED;
  }
  ssize_t rc = libssh2_channel_read(channel, buf, count);
  if (rc > 0) {
    return rc;
  }
  if (rc == 0) {
    return libssh2_channel_eof(channel) ? ssize_t(CHANNEL_CLOSED) : 0;
  }
  if (rc == LIBSSH2_ERROR_EAGAIN) {
    return 0;
  }
  return mapErrorLocked(rc);
}

ssize_t Libssh2Channel::write(const char* buf, size_t count) {
  lock_guard<mutex> guard(session->getIoMutex());
  if (!channel || !session->get()) {
    return CHANNEL_CLOSED;
  }
  ssize_t rc = libssh2_channel_write(channel, buf, count);
  if (rc >= 0) {
    return rc;
  }
  if (rc == LIBSSH2_ERROR_EAGAIN) {
    return CHANNEL_WOULD_BLOCK;
  }
  // libssh2 reads pending packets before every write and reports a failure
  // there with this message
  if (session->lastErrorLocked().find("draining incoming flow") !=
      string::npos) {
    return CHANNEL_DRAINING;
  }
  return mapErrorLocked(rc);
}

bool Libssh2Channel::eof() {
  lock_guard<mutex> guard(session->getIoMutex());
  if (!channel || !session->get()) {
    return true;
  }
  return libssh2_channel_eof(channel) == 1;
}

size_t Libssh2Channel::writeWindow() {
  lock_guard<mutex> guard(session->getIoMutex());
  if (!channel || !session->get()) {
    return 0;
  }
  return libssh2_channel_window_write_ex(channel, NULL);
}

void Libssh2Channel::resize(int cols, int rows) {
  int rc = 0;
  bool done = retryWhileBlocked(
      [this, cols, rows, &rc]() {
        lock_guard<mutex> guard(session->getIoMutex());
        if (!channel || !session->get()) {
          rc = LIBSSH2_ERROR_CHANNEL_CLOSED;
          return true;
        }
        rc = libssh2_channel_request_pty_size(channel, cols, rows);
        return rc != LIBSSH2_ERROR_EAGAIN;
      },
      100, EAGAIN_PAUSE);
  if (!done || rc) {
    throw ChannelError("Failed to resize terminal to " + to_string(cols) +
                       "x" + to_string(rows));
  }
}

void Libssh2Channel::close() {
  lock_guard<mutex> guard(session->getIoMutex());
  if (!channel) {
    return;
  }
  if (!session->get()) {
    // Freeing the session already released every channel
    channel = NULL;
    return;
  }
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
  while (libssh2_channel_close(channel) == LIBSSH2_ERROR_EAGAIN &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  while (libssh2_channel_free(channel) == LIBSSH2_ERROR_EAGAIN &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  channel = NULL;
}

ssize_t Libssh2Channel::mapErrorLocked(ssize_t rc) {
  if (session->checkSocketErrorLocked(int(rc))) {
    return CHANNEL_BROKEN;
  }
  switch (rc) {
    case LIBSSH2_ERROR_CHANNEL_CLOSED:
    case LIBSSH2_ERROR_CHANNEL_EOF_SENT:
      return CHANNEL_CLOSED;
    default:
      VLOG(1) << "Channel error " << rc << ": " << session->lastErrorLocked();
      return CHANNEL_FAILED;
  }
}

Libssh2BlockingTransport::Libssh2BlockingTransport(
    shared_ptr<Libssh2Session> _session)
    : session(_session), endpoint(_session->getEndpoint()) {}

Libssh2BlockingTransport::~Libssh2BlockingTransport() {}

bool Libssh2BlockingTransport::isAlive() {
  auto s = checkedSession();
  return s && s->isAlive();
}

void Libssh2BlockingTransport::disconnect(const string& reason) {
  auto s = release();
  if (s) {
    s->disconnect(reason);
  }
}

CommandResult Libssh2BlockingTransport::execute(const string& command) {
  auto s = checkedSession();
  if (!s) {
    throw IoError("Transport to " + endpoint.name() + " is closed");
  }
  lock_guard<mutex> guard(s->getIoMutex());
  if (!s->get()) {
    throw IoError("Transport to " + endpoint.name() + " is closed");
  }
  CommandResult result = runLocked(s->get(), wrapInShell(command, true));
  if (result.has_exit_code() && result.exit_code() == 127 &&
      result.output().find("bash") != string::npos &&
      result.output().find("not found") != string::npos) {
    LOG(INFO) << "bash is not available on " << endpoint.name()
              << ", retrying with sh";
    result = runLocked(s->get(), wrapInShell(command, false));
  }
  return result;
}

CommandResult Libssh2BlockingTransport::runLocked(LIBSSH2_SESSION* s,
                                                  const string& shellCommand) {
  LIBSSH2_CHANNEL* channel = libssh2_channel_open_session(s);
  if (!channel) {
    int rc = libssh2_session_last_errno(s);
    session->checkSocketErrorLocked(rc);
    throw IoError("Failed to open channel: " + session->lastErrorLocked());
  }
  std::shared_ptr<LIBSSH2_CHANNEL> channelGuard(channel, libssh2_channel_free);

  int rc = libssh2_channel_exec(channel, shellCommand.c_str());
  if (rc) {
    session->checkSocketErrorLocked(rc);
    throw IoError("Failed to start command: " + session->lastErrorLocked());
  }
  string output = readStreamLocked(s, channel, 0);
  string errors = readStreamLocked(s, channel, SSH_EXTENDED_DATA_STDERR);
  if (!errors.empty()) {
    if (!output.empty() && output.back() != '\n') {
      output.push_back('\n');
    }
    output.append(errors);
  }

  CommandResult result;
  result.set_output(output);
  libssh2_channel_close(channel);
  if (libssh2_channel_wait_closed(channel) == 0) {
    result.set_exit_code(libssh2_channel_get_exit_status(channel));
  } else {
    LOG(WARNING) << "No exit status for command: "
                 << session->lastErrorLocked();
  }
  return result;
}

string Libssh2BlockingTransport::readStreamLocked(LIBSSH2_SESSION* s,
                                                  LIBSSH2_CHANNEL* channel,
                                                  int streamId) {
  string retval;
  char buf[8192];
  while (true) {
    ssize_t rc = libssh2_channel_read_ex(channel, streamId, buf, sizeof(buf));
    if (rc > 0) {
      retval.append(buf, rc);
    } else if (rc == 0) {
      break;
    } else if (rc == LIBSSH2_ERROR_EAGAIN) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    } else {
      session->checkSocketErrorLocked(int(rc));
      throw IoError("Failed reading command output: " +
                    session->lastErrorLocked());
    }
  }
  return retval;
}

vector<RemoteFileInfo> Libssh2BlockingTransport::listDirectory(
    const string& path) {
  auto s = checkedSession();
  if (!s) {
    throw IoError("Transport to " + endpoint.name() + " is closed");
  }
  lock_guard<mutex> guard(s->getIoMutex());
  if (!s->get()) {
    throw IoError("Transport to " + endpoint.name() + " is closed");
  }
  LIBSSH2_SFTP* rawSftp = libssh2_sftp_init(s->get());
  if (!rawSftp) {
    s->checkSocketErrorLocked(libssh2_session_last_errno(s->get()));
    throw ChannelError("Could not start file transfer: " +
                       s->lastErrorLocked());
  }
  std::shared_ptr<LIBSSH2_SFTP> sftp(rawSftp, libssh2_sftp_shutdown);

  LIBSSH2_SFTP_HANDLE* rawDir = libssh2_sftp_opendir(sftp.get(), path.c_str());
  if (!rawDir) {
    throw ChannelError("Could not open directory " + path + ": " +
                       s->lastErrorLocked());
  }
  std::shared_ptr<LIBSSH2_SFTP_HANDLE> dir(rawDir, libssh2_sftp_closedir);

  vector<RemoteFileInfo> entries;
  char name[1024];
  char longEntry[1024];
  while (true) {
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    int rc = libssh2_sftp_readdir_ex(dir.get(), name, sizeof(name), longEntry,
                                     sizeof(longEntry), &attrs);
    if (rc == 0) {
      break;
    }
    if (rc < 0) {
      throw ChannelError("Failed listing " + path + ": " +
                         s->lastErrorLocked());
    }
    string entryName(name, rc);
    if (entryName == "." || entryName == "..") {
      continue;
    }
    RemoteFileInfo info;
    info.set_name(entryName);
    info.set_path(remoteChildPath(path, entryName));
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
      if (LIBSSH2_SFTP_S_ISDIR(attrs.permissions)) {
        info.set_file_type("directory");
      } else if (LIBSSH2_SFTP_S_ISLNK(attrs.permissions)) {
        info.set_file_type("symlink");
      } else {
        info.set_file_type("file");
      }
      char permissions[8];
      snprintf(permissions, sizeof(permissions), "%o",
               (unsigned int)(attrs.permissions & 0777));
      info.set_permissions(permissions);
    } else {
      info.set_file_type("file");
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) {
      info.set_size(attrs.filesize);
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) {
      info.set_modified(attrs.mtime);
    }
    entries.push_back(info);
  }
  return entries;
}

shared_ptr<Libssh2Session> Libssh2BlockingTransport::release() {
  lock_guard<mutex> guard(transportMutex);
  auto retval = session;
  session.reset();
  return retval;
}

shared_ptr<Libssh2Session> Libssh2BlockingTransport::checkedSession() {
  lock_guard<mutex> guard(transportMutex);
  return session;
}

Libssh2NonBlockingTransport::Libssh2NonBlockingTransport(
    shared_ptr<Libssh2Session> _session, const TerminalConfig& _config)
    : session(_session), config(_config) {
  session->setBlocking(false);
}

Libssh2NonBlockingTransport::~Libssh2NonBlockingTransport() {}

bool Libssh2NonBlockingTransport::isAlive() { return session->isAlive(); }

void Libssh2NonBlockingTransport::disconnect(const string& reason) {
  session->disconnect(reason);
}

shared_ptr<Channel> Libssh2NonBlockingTransport::openTerminalChannel(int cols,
                                                                     int rows) {
  LIBSSH2_CHANNEL* channel = NULL;
  string error;
  retryWhileBlockedFor(
      [this, &channel, &error]() {
        lock_guard<mutex> guard(session->getIoMutex());
        if (!session->get()) {
          error = "session closed";
          return true;
        }
        channel = libssh2_channel_open_session(session->get());
        if (channel) {
          return true;
        }
        int rc = libssh2_session_last_errno(session->get());
        if (rc == LIBSSH2_ERROR_EAGAIN) {
          return false;
        }
        session->checkSocketErrorLocked(rc);
        error = session->lastErrorLocked();
        return true;
      },
      CHANNEL_SETUP_TIMEOUT, EAGAIN_PAUSE);
  if (!channel) {
    throw ChannelError("Failed to open terminal channel: " +
                       (error.empty() ? string("timed out") : error));
  }
  // Owns the raw channel from here on, close() runs on every failure below
  auto retval = make_shared<Libssh2Channel>(session, channel);

  auto runSetupStep = [this, &error](const string& step,
                                     const std::function<int()>& call) {
    int rc = 0;
    bool done = retryWhileBlockedFor(
        [this, &rc, &call]() {
          lock_guard<mutex> guard(session->getIoMutex());
          if (!session->get()) {
            rc = LIBSSH2_ERROR_SOCKET_DISCONNECT;
            return true;
          }
          rc = call();
          return rc != LIBSSH2_ERROR_EAGAIN;
        },
        CHANNEL_SETUP_TIMEOUT, EAGAIN_PAUSE);
    if (!done || rc) {
      throw ChannelError("Failed to " + step + ": " +
                         (done ? to_string(rc) : string("timed out")));
    }
  };
  const string& ptyType = config.ptyType;
  runSetupStep("request pty", [channel, &ptyType, cols, rows]() {
    return libssh2_channel_request_pty_ex(channel, ptyType.c_str(),
                                          (unsigned int)ptyType.length(), NULL,
                                          0, cols, rows, 0, 0);
  });
  runSetupStep("start shell",
               [channel]() { return libssh2_channel_shell(channel); });
  VLOG(1) << "Opened " << cols << "x" << rows << " terminal channel on "
          << session->getEndpoint();
  return retval;
}

Libssh2TransportFactory::Libssh2TransportFactory(
    const ConnectionConfig& _connectionConfig,
    const TerminalConfig& _terminalConfig)
    : connectionConfig(_connectionConfig), terminalConfig(_terminalConfig) {
  std::call_once(libssh2InitFlag, []() {
    int rc = libssh2_init(0);
    if (rc) {
      STFATAL << "libssh2 initialization failed: " << rc;
    }
  });
}

shared_ptr<BlockingTransport> Libssh2TransportFactory::connect(
    const ConnectionParams& params) {
  return make_shared<Libssh2BlockingTransport>(
      Libssh2Session::dial(params, connectionConfig.connectTimeout));
}

shared_ptr<NonBlockingTransport> Libssh2TransportFactory::toNonBlocking(
    shared_ptr<BlockingTransport> transport) {
  auto libssh2Transport =
      std::dynamic_pointer_cast<Libssh2BlockingTransport>(transport);
  if (!libssh2Transport) {
    STFATAL << "Tried to convert a transport from another factory";
  }
  auto session = libssh2Transport->release();
  if (!session) {
    throw ConnectionError("Transport was already released");
  }
  return make_shared<Libssh2NonBlockingTransport>(session, terminalConfig);
}
}  // namespace ot
