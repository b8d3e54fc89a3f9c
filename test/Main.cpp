#define CATCH_CONFIG_RUNNER

#include <cstring>

#include "EngineConfig.hpp"
#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace wt;

namespace {
bool onlyListing(int argc, char **argv) {
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--list-tests") == 0 || strcmp(argv[i], "-l") == 0 ||
        strcmp(argv[i], "--list-tags") == 0) {
      return true;
    }
  }
  return false;
}
}  // namespace

int main(int argc, char **argv) {
  srand(1);
  bool listOnly = onlyListing(argc, argv);

  // Session ids are drawn from libsodium
  if (sodium_init() == -1) {
    STFATAL << "libsodium init failed";
  }

  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();
  wt::HandleTerminate();

  string logDirectoryPattern = GetTempDirectory() + string("wt_test_XXXXXXXX");
  EngineConfig logConfig;
  logConfig.logDirectory = string(mkdtemp(&logDirectoryPattern[0]));
  // logConfig.verbose = 3;
  if (!listOnly) {
    CLOG(INFO, "stdout") << "Writing log to " << logConfig.logDirectory
                         << endl;
  }
  LogHandler::setupSessionLogging(&defaultConf, logConfig, "wt-test", false,
                                  false);

  int result = Catch::Session().run(argc, argv);

  el::Helpers::uninstallPreRollOutCallback();
  fs::remove_all(logConfig.logDirectory);
  return result;
}
