#include <cxxopts.hpp>

#include "ConsoleTerminalEmulator.hpp"
#include "EngineConfig.hpp"
#include "FileBrowserProtocol.hpp"
#include "Headers.hpp"
#include "LogHandler.hpp"
#include "ServerRegistry.hpp"
#include "SessionRegistry.hpp"
#include "WebSocketContext.hpp"

using namespace wt;

namespace {
volatile sig_atomic_t shuttingDown = 0;

void handleParseException(std::exception& e, cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}

void quitSignalHandler(int) { shuttingDown = 1; }

string formatProgress(const TransferProgress& progress) {
  ostringstream ss;
  ss << progress.fileName << " " << progress.percent << "% ("
     << progress.transferredBytes << "/" << progress.totalSize << " bytes, "
     << int64_t(progress.bytesPerSecond / 1024) << " KiB/s) "
     << transferStateName(progress.state);
  return ss.str();
}

ServerRef resolveServer(const cxxopts::ParseResult& result,
                        const string& cfgFile) {
  int64_t serverId = result["server"].as<int64_t>();
  if (result.count("host")) {
    ServerRef serverRef;
    serverRef.set_id(serverId);
    serverRef.set_host(result["host"].as<string>());
    serverRef.set_name(serverRef.host());
    return serverRef;
  }
  if (cfgFile.empty()) {
    throw std::runtime_error(
        "Either --cfgfile with [server.<id>] sections or --host is required");
  }
  IniServerRegistry serverRegistry;
  serverRegistry.loadFile(cfgFile);
  return serverRegistry.lookup(serverId);
}

vector<shared_ptr<FileSource>> openSendFiles(const vector<string>& paths) {
  vector<shared_ptr<FileSource>> files;
  for (const auto& path : paths) {
    try {
      files.push_back(shared_ptr<FileSource>(new DiskFileSource(path)));
    } catch (const std::runtime_error& e) {
      LOG(WARNING) << "Not offering " << path << ": " << e.what();
    }
  }
  return files;
}

int runTerminal(SessionRegistry& registry, const ServerRef& serverRef,
                shared_ptr<FileSinkProvider> sinkProvider,
                const vector<string>& sendPaths) {
  shared_ptr<ConsoleTerminalEmulator> console(new ConsoleTerminalEmulator());
  string id = registry.connectTerminal(serverRef, console, sinkProvider);
  shared_ptr<TerminalSession> session = registry.getTerminal(id);
  session->setSendFileProvider(
      [sendPaths]() { return openSendFiles(sendPaths); });
  session->setTransferProgressHandler([](const TransferProgress& progress) {
    LOG(INFO) << "Transfer " << formatProgress(progress);
  });
  int exitCode = 0;
  session->setErrorHandler([&exitCode](const SessionError& error) {
    LOG(ERROR) << "Terminal session failed: " << error.what();
    exitCode = 1;
  });

  while (!shuttingDown) {
    if (!console->update(10)) {
      LOG(INFO) << "Console closed";
      break;
    }
    registry.update(0);
    if (session->getStatus() == SessionStatus::DISCONNECTED) {
      break;
    }
  }
  registry.disconnect(id);
  return exitCode;
}

void printListing(const string& path, const vector<FileEntry>& entries) {
  CLOG(INFO, "stdout") << path << ":" << endl;
  for (const auto& entry : entries) {
    CLOG(INFO, "stdout") << formatPermissions(entry) << " " << setw(12)
                         << entry.size() << " " << entry.name()
                         << (entry.is_dir() ? "/" : "") << endl;
  }
}

void runFileCommand(shared_ptr<FileBrowserSession> browser,
                    const vector<string>& args) {
  const string& command = args[0];
  auto onError = [](const SessionError& error) {
    CLOG(INFO, "stdout") << "Error: " << error.what() << endl;
  };
  auto remotePath = [browser](const string& name) {
    return (!name.empty() && name[0] == '/')
               ? name
               : joinRemotePath(browser->getCurrentPath(), name);
  };
  if (command == "ls") {
    browser->listDir(args.size() > 1 ? remotePath(args[1])
                                     : browser->getCurrentPath());
  } else if (command == "cd" && args.size() == 2) {
    browser->listDir(args[1] == ".."
                         ? parentRemotePath(browser->getCurrentPath())
                         : remotePath(args[1]));
  } else if (command == "rm" && args.size() == 2) {
    browser->deleteFile(remotePath(args[1]));
  } else if (command == "rmdir" && args.size() == 2) {
    browser->deleteDir(remotePath(args[1]));
  } else if (command == "mkdir" && args.size() == 2) {
    browser->createDir(remotePath(args[1]));
  } else if (command == "mv" && args.size() == 3) {
    browser->rename(remotePath(args[1]), remotePath(args[2]));
  } else if (command == "chmod" && args.size() == 3) {
    browser->setPermissions(remotePath(args[2]),
                            int(std::stol(args[1], NULL, 8)));
  } else if (command == "cat" && args.size() == 2) {
    browser->readFileContent(
        remotePath(args[1]),
        [](const string& content) { CLOG(INFO, "stdout") << content << endl; },
        onError);
  } else if (command == "put" && (args.size() == 2 || args.size() == 3)) {
    shared_ptr<FileSource> source(new DiskFileSource(args[1]));
    string target =
        remotePath(args.size() == 3 ? args[2] : source->getName());
    browser->upload(
        target, source,
        [](shared_ptr<Transfer> transfer) {
          CLOG(INFO, "stdout") << "Uploaded " << transfer->getFileName()
                               << endl;
        },
        onError);
  } else if (command == "get" && args.size() == 2) {
    browser->downloadFile(
        remotePath(args[1]),
        [](shared_ptr<Transfer> transfer) {
          CLOG(INFO, "stdout") << "Downloaded " << transfer->getFileName()
                               << endl;
        },
        onError);
  } else if (command == "cancel") {
    browser->cancelUpload();
  } else {
    CLOG(INFO, "stdout")
        << "Commands: ls [path], cd path, rm path, rmdir path, mkdir path, "
           "mv from to, chmod mode path, cat path, put local [remote], "
           "get remote, cancel, quit"
        << endl;
  }
}

int runFileBrowser(SessionRegistry& registry, const ServerRef& serverRef,
                   shared_ptr<FileSinkProvider> sinkProvider) {
  string id = registry.connectFileBrowser(serverRef, sinkProvider);
  shared_ptr<FileBrowserSession> browser = registry.getFileBrowser(id);
  browser->setListingHandler(printListing);
  browser->setMessageHandler([](const string& message) {
    CLOG(INFO, "stdout") << message << endl;
  });
  browser->setErrorHandler([](const SessionError& error) {
    CLOG(INFO, "stdout") << sessionErrorKindName(error.getKind()) << ": "
                         << error.what() << endl;
  });
  browser->setTransferProgressHandler([](const TransferProgress& progress) {
    CLOG(INFO, "stdout") << formatProgress(progress) << endl;
  });

  while (!shuttingDown) {
    registry.update(0);
    if (browser->getStatus() == SessionStatus::DISCONNECTED) {
      CLOG(INFO, "stdout") << "Disconnected" << endl;
      break;
    }
    // Servicing the sockets never blocks, so stdin paces the loop
    if (!waitOnFdData(STDIN_FILENO, 10)) {
      continue;
    }
    string line;
    if (!std::getline(std::cin, line)) {
      break;
    }
    vector<string> args;
    for (const auto& token : split(line, ' ')) {
      if (!token.empty()) {
        args.push_back(token);
      }
    }
    if (args.empty()) {
      continue;
    }
    if (args[0] == "quit" || args[0] == "exit") {
      break;
    }
    if (!browser->isConnected()) {
      CLOG(INFO, "stdout") << "Still connecting" << endl;
      continue;
    }
    try {
      runFileCommand(browser, args);
    } catch (const std::invalid_argument& e) {
      CLOG(INFO, "stdout") << "Invalid argument: " << e.what() << endl;
    } catch (const std::runtime_error& e) {
      CLOG(INFO, "stdout") << e.what() << endl;
    }
  }
  registry.disconnect(id);
  return 0;
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  wt::HandleTerminate();

  ::signal(SIGINT, wt::InterruptSignalHandler);
  ::signal(SIGTERM, quitSignalHandler);
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("wt", "Terminal and file browser for a web proxy");
  int exitCode = 0;
  try {
    options.positional_help("");
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("s,server", "Id of the server to connect to",
         cxxopts::value<int64_t>())  //
        ("m,mode", "Session kind: terminal or sftp",
         cxxopts::value<std::string>()->default_value("terminal"))  //
        ("c,cfgfile", "Engine and server configuration file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("host", "Server host, when it is not in the configuration file",
         cxxopts::value<std::string>())  //
        ("api-url", "Base URL of the web proxy",
         cxxopts::value<std::string>())  //
        ("d,download-dir", "Directory that receives downloads",
         cxxopts::value<std::string>())  //
        ("send", "Files offered when the remote side runs rz",
         cxxopts::value<std::vector<std::string>>())  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>())  //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>())  //
        ("logtostdout", "Write log to stdout");

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }

    if (result.count("version")) {
      CLOG(INFO, "stdout") << "wt version " << WT_VERSION << endl;
      exit(0);
    }

    if (!result.count("server")) {
      CLOG(INFO, "stdout") << "Missing server to connect to" << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(1);
    }

    string cfgFile = result["cfgfile"].as<string>();
    EngineConfig config;
    if (!cfgFile.empty()) {
      config = loadEngineConfig(cfgFile);
    }
    if (result.count("api-url")) {
      config.apiUrl = result["api-url"].as<string>();
    }
    if (result.count("download-dir")) {
      config.downloadDirectory = result["download-dir"].as<string>();
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    if (result.count("logdir")) {
      config.logDirectory = result["logdir"].as<string>();
    }
    string mode = result["mode"].as<string>();
    if (mode != "terminal" && mode != "sftp") {
      CLOG(INFO, "stdout") << "Unknown mode: " << mode << endl;
      exit(1);
    }

    // The terminal owns stdout, so logs only go there when asked for
    bool logToStdout = result.count("logtostdout") > 0;
    LogHandler::setupSessionLogging(&defaultConf, config, "wt", logToStdout,
                                    mode == "terminal" && !logToStdout);
    el::Helpers::setThreadName("client-main");

    GOOGLE_PROTOBUF_VERIFY_VERSION;
    if (sodium_init() == -1) {
      STFATAL << "libsodium init failed";
    }

    ServerRef serverRef = resolveServer(result, cfgFile);
    vector<string> sendPaths;
    if (result.count("send")) {
      sendPaths = result["send"].as<std::vector<std::string>>();
    }

    shared_ptr<WebSocketContext> webSocketContext(new WebSocketContext());
    shared_ptr<Clock> clock(new SteadyClock());
    shared_ptr<FileSinkProvider> sinkProvider(
        new DiskFileSinkProvider(config.downloadDirectory));
    LOG(INFO) << "Connecting to " << serverRef << " through "
              << config.apiUrl;
    {
      SessionRegistry registry(webSocketContext, clock, config);
      if (mode == "terminal") {
        exitCode = runTerminal(registry, serverRef, sinkProvider, sendPaths);
      } else {
        exitCode = runFileBrowser(registry, serverRef, sinkProvider);
      }
    }
  } catch (cxxopts::exceptions::exception& oe) {
    handleParseException(oe, options);
  } catch (const std::runtime_error& e) {
    CLOG(INFO, "stdout") << "Error: " << e.what() << endl;
    exitCode = 1;
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();

  return exitCode;
}
