#include <cxxopts.hpp>

#include "Headers.hpp"
#include "HostParsing.hpp"
#include "Libssh2Transport.hpp"
#include "LogHandler.hpp"
#include "OpsConfig.hpp"
#include "PseudoTerminalConsole.hpp"
#include "SessionPool.hpp"

using namespace ot;

namespace {
const char* INTERACTIVE_TERMINAL_ID = "interactive";

volatile sig_atomic_t windowResized = 0;

void handleWindowChange(int) { windowResized = 1; }

void handleParseException(std::exception& e, cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}

template <class T, class DefaultT>
T extractSingleOptionWithDefault(const cxxopts::ParseResult& result,
                                 const cxxopts::Options& options,
                                 const string& name, DefaultT defaultValue) {
  auto count = result.count(name);
  if (count == 0) {
    return defaultValue;
  }
  if (count == 1) {
    return result[name].as<T>();
  }
  CLOG(INFO, "stdout") << "Value for " << name
                       << " must be specified only once\n";
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(0);
}

string localUsername() {
  passwd* pw = getpwuid(getuid());
  if (pw == NULL || pw->pw_name == NULL) {
    return "";
  }
  return string(pw->pw_name);
}

string readPassword(const TransportEndpoint& endpoint) {
  const char* fromEnv = ::getenv("OPSTERM_PASSWORD");
  if (fromEnv != NULL) {
    return string(fromEnv);
  }
  cout << endpoint << "'s password: " << flush;
  termios oldTerminal;
  bool isTty = tcgetattr(STDIN_FILENO, &oldTerminal) == 0;
  if (isTty) {
    termios noEcho = oldTerminal;
    noEcho.c_lflag &= ~ECHO;
    tcsetattr(STDIN_FILENO, TCSANOW, &noEcho);
  }
  string password;
  std::getline(cin, password);
  if (isTty) {
    tcsetattr(STDIN_FILENO, TCSANOW, &oldTerminal);
  }
  cout << endl;
  return password;
}

int printCommandResult(const CommandResult& result) {
  cout << result.output() << flush;
  if (!result.has_exit_code()) {
    LOG(WARNING) << "Remote side did not report an exit status";
    return 1;
  }
  return result.exit_code();
}

void printDirectory(const vector<RemoteFileInfo>& entries) {
  for (const auto& entry : entries) {
    char line[64];
    snprintf(line, sizeof(line), "%-9s %4s %12llu ", entry.file_type().c_str(),
             entry.permissions().c_str(), (unsigned long long)entry.size());
    cout << line << entry.name() << endl;
  }
}

// Shared with the worker thread, which may outlive runInteractive()
struct InteractiveState {
  std::atomic<bool> closed{false};
  mutex closeMutex;
  string closeError;
};

void runInteractive(SessionPool* pool) {
  shared_ptr<Console> console(new PseudoTerminalConsole());
  auto state = make_shared<InteractiveState>();

  TerminalSize size = console->getTerminalSize();
  pool->openTerminal(INTERACTIVE_TERMINAL_ID, size.column(), size.row(),
                     [console, state](const TerminalEvent& event) {
                       if (event.has_data()) {
                         console->write(event.data());
                       }
                       if (event.closed()) {
                         lock_guard<mutex> guard(state->closeMutex);
                         state->closeError = event.error();
                         state->closed = true;
                       }
                     });
  ::signal(SIGWINCH, handleWindowChange);
  console->setup();

  char buf[4096];
  int inputFd = console->getInputFd();
  while (!state->closed) {
    if (windowResized) {
      windowResized = 0;
      TerminalSize newSize = console->getTerminalSize();
      try {
        pool->resizeTerminal(INTERACTIVE_TERMINAL_ID, newSize.column(),
                             newSize.row());
      } catch (const ChannelError& ce) {
        LOG(WARNING) << "Resize failed: " << ce.what();
      }
    }

    fd_set rfd;
    timeval tv;
    FD_ZERO(&rfd);
    FD_SET(inputFd, &rfd);
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int rc = select(inputFd + 1, &rfd, NULL, NULL, &tv);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      FATAL_FAIL(rc);
    }
    if (rc == 0 || !FD_ISSET(inputFd, &rfd)) {
      continue;
    }
    ssize_t bytesRead = ::read(inputFd, buf, sizeof(buf));
    if (bytesRead < 0 && errno == EINTR) {
      continue;
    }
    FATAL_FAIL(bytesRead);
    if (bytesRead == 0) {
      break;
    }
    try {
      pool->sendTerminalInput(INTERACTIVE_TERMINAL_ID, string(buf, bytesRead));
    } catch (const FlowControlError& fce) {
      LOG(WARNING) << "Dropped keystrokes: " << fce.what();
    } catch (const ChannelError& ce) {
      LOG(INFO) << "Terminal no longer accepts input: " << ce.what();
      break;
    }
  }

  console->teardown();
  ::signal(SIGWINCH, SIG_DFL);
  pool->closeTerminal(INTERACTIVE_TERMINAL_ID);
  lock_guard<mutex> guard(state->closeMutex);
  if (!state->closeError.empty()) {
    CLOG(INFO, "stdout") << "Terminal closed: " << state->closeError << endl;
  }
}
}  // namespace

int main(int argc, char** argv) {
  string tmpDir = GetTempDirectory();

  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  ot::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, ot::InterruptSignalHandler);

  cxxopts::Options options("opsterm",
                           "Remote shells and admin commands over one SSH "
                           "connection");
  int exitCode = 0;
  try {
    options.positional_help("");
    options.custom_help("[OPTION...] [user@]host[:port]");

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("u,username", "Username", cxxopts::value<std::string>())  //
        ("host", "Remote host name", cxxopts::value<std::string>())  //
        ("p,port", "Remote ssh port",
         cxxopts::value<int>()->default_value("22"))  //
        ("c,command", "Run command and exit",
         cxxopts::value<std::string>())  //
        ("dashboard", "Run command on the fast path and exit",
         cxxopts::value<std::string>())  //
        ("ls", "List a remote directory and exit",
         cxxopts::value<std::string>())  //
        ("as-user", "Run the --dashboard command as this remote user",
         cxxopts::value<std::string>())  //
        ("config", "Path to the config file",
         cxxopts::value<std::string>())  //
        ("health", "Print a health report on exit")  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"))  //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>()->default_value(tmpDir))  //
        ("logtostdout", "Write log to stdout")                  //
        ("silent", "Disable logging");

    options.parse_positional({"host"});
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }

    if (result.count("version")) {
      CLOG(INFO, "stdout") << "opsterm version " << OT_VERSION << endl;
      exit(0);
    }

    if (result.count("silent")) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    LogHandler::setupLogFiles(&defaultConf, result["logdir"].as<string>(),
                              "opsterm", result.count("logtostdout"),
                              !result.count("logtostdout"));
    LogHandler::apply(defaultConf, result["verbose"].as<int>());
    LogHandler::nameThread("opsterm-main");

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    if (!result.count("host")) {
      CLOG(INFO, "stdout") << "Missing host to connect to" << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(1);
    }

    string username = extractSingleOptionWithDefault<string>(
        result, options, "username", localUsername());
    TransportEndpoint endpoint =
        parseTransportEndpoint(result["host"].as<string>(), username,
                               result["port"].as<int>());

    string configPath = extractSingleOptionWithDefault<string>(
        result, options, "config", OpsConfig::defaultPath());
    OpsConfig config = OpsConfig::load(configPath);

    auto factory = make_shared<Libssh2TransportFactory>(config.connection,
                                                        config.terminal);
    SessionPool pool(factory, config);

    string password = readPassword(endpoint);
    try {
      pool.connect(endpoint, password);
    } catch (const AuthenticationError& ae) {
      CredentialVault::wipeString(&password);
      CLOG(INFO, "stdout") << "Authentication failed: " << ae.what() << endl;
      exit(1);
    } catch (const ConnectionError& ce) {
      CredentialVault::wipeString(&password);
      CLOG(INFO, "stdout") << "Could not connect to " << endpoint << ": "
                           << ce.what() << endl;
      exit(1);
    }
    CredentialVault::wipeString(&password);

    try {
      if (result.count("command")) {
        exitCode = printCommandResult(
            pool.execute(result["command"].as<string>()));
      } else if (result.count("dashboard")) {
        string command = result["dashboard"].as<string>();
        if (result.count("as-user")) {
          exitCode = printCommandResult(pool.executeFastPathAsUser(
              command, result["as-user"].as<string>()));
        } else {
          exitCode = printCommandResult(pool.executeFastPath(command));
        }
      } else if (result.count("ls")) {
        printDirectory(pool.listDirectory(result["ls"].as<string>()));
      } else {
        runInteractive(&pool);
      }
    } catch (const CommandRejected& cr) {
      CLOG(INFO, "stdout") << "Command rejected: " << cr.what() << endl;
      exitCode = 1;
    } catch (const std::runtime_error& re) {
      LOG(ERROR) << "Operation failed: " << re.what();
      CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
      exitCode = 1;
    }

    if (result.count("health")) {
      CLOG(INFO, "stdout") << pool.health()->report().dump(2) << endl;
    }
    pool.disconnect();
  } catch (cxxopts::exceptions::exception& oe) {
    handleParseException(oe, options);
  } catch (const std::runtime_error& re) {
    CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
    exitCode = 1;
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();

  return exitCode;
}
