#include "applog.hpp"
#include "configstore.hpp"
#include "connectionregistry.hpp"
#include "geoserverclient.hpp"
#include "httpclient.hpp"
#include "localbrowser.hpp"
#include "terminalapp.hpp"
#include "verification.hpp"

#include <cstdlib>
#include <iostream>

#include <spdlog/spdlog.h>

namespace {

void printUsage(const char *program) {
  std::cout << "Usage: " << program << " [options]\n"
            << "  -c, --config <file>  configuration file (default: "
            << ConfigStore::defaultPath().string() << ")\n"
            << "  -l, --log <file>     log file (default: "
            << defaultLogPath().string() << ")\n"
            << "  -v, --verbose        debug logging\n"
            << "  -h, --help           show this help\n";
}

std::filesystem::path startDirectory(const AppConfig &config) {
  if (!config.lastLocalPath.empty())
    return config.lastLocalPath;
  if (const char *home = std::getenv("HOME"))
    return home;
  return std::filesystem::current_path();
}

} // namespace

int main(int argc, char *argv[]) {
  std::filesystem::path config_path = ConfigStore::defaultPath();
  std::filesystem::path log_path = defaultLogPath();
  bool verbose = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
      config_path = argv[++i];
    } else if ((arg == "-l" || arg == "--log") && i + 1 < argc) {
      log_path = argv[++i];
    } else if (arg == "-v" || arg == "--verbose") {
      verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else {
      std::cerr << "Unknown or incomplete option: " << arg << "\n";
      printUsage(argv[0]);
      return 2;
    }
  }

  if (!initLogging(log_path, verbose))
    std::cerr << "Warning: cannot write log file " << log_path.string()
              << ", logging disabled\n";

  CurlGlobal curl;
  if (!curl.ok()) {
    std::cerr << "Error: libcurl initialisation failed\n";
    return 1;
  }

  auto store = std::make_shared<ConfigStore>(config_path);
  Result<AppConfig> loaded = store->load();
  if (!loaded) {
    std::cerr << "Error: " << loaded.error() << "\n";
    return 1;
  }

  try {
    World world;
    world.config = std::move(loaded.value());
    world.store = store;
    world.registry = std::make_shared<ConnectionRegistry>(
        [](const Connection &connection) -> std::shared_ptr<IResourceClient> {
          return std::make_shared<GeoServerClient>(connection);
        });
    world.browser = std::make_shared<LocalBrowser>(startDirectory(world.config));
    world.summaryReader = std::make_shared<OgrInfoReader>();

    spdlog::info("using configuration {}", config_path.string());
    TerminalApp app(std::move(world));
    return app.run();
  } catch (const std::exception &e) {
    // Terminal is already restored once the screen is gone
    spdlog::critical("fatal: {}", e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
