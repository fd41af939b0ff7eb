#include "application.hpp"
#include "config.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <algorithm>
#include <iostream> // Keep for CLI output and early errors before logger initialized

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Node settings are read from the environment:\n"
      << "  INTERVAL_SECONDS, ANTI_ENTROPY_SECONDS, PEER_TTL_SECONDS, TOPIC,\n"
      << "  HTTP_PORT, BOOTSTRAP_PEERS, LISTEN_PORT, DISCOVERY_GROUP,\n"
      << "  DISCOVERY_PORT, DISCOVERY_INTERVAL_SECONDS, LOG_LEVEL\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: $LOG_LEVEL, else info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, gossip, dht, discovery, membership,\n"
      << "                       http, crypto, app, all\n"
      << "                       Can be comma-separated: --debug=gossip,dht\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "  --logfile=<path>     Also write logs to a rotating file\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    // LOG_LEVEL seeds the level; command line flags win
    std::string log_level = peerwatch::app::GetProcessEnv("LOG_LEVEL").value_or("info");
    std::string log_file;
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << peerwatch::GetFullVersionString() << std::endl;
        std::cout << peerwatch::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg == "--verbose") {
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--logfile=") == 0) {
        log_file = arg.substr(10);
        if (log_file.empty()) {
          std::cerr << "Error: --logfile requires a path" << std::endl;
          return 1;
        }
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=gossip,dht
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    peerwatch::util::LogManager::Initialize(log_level, !log_file.empty(),
                                            log_file.empty() ? "peerwatch.log" : log_file);

    // Apply component-specific debug levels
    const auto &known = peerwatch::util::LogManager::Components();
    for (const auto &component : debug_components) {
      if (component == "all") {
        peerwatch::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        peerwatch::util::LogManager::SetComponentLevel("network", "trace");
      } else if (std::find(known.begin(), known.end(), component) != known.end()) {
        peerwatch::util::LogManager::SetComponentLevel(component, "trace");
      } else {
        LOG_WARN("Unknown debug component '{}' ignored", component);
      }
    }

    // Read after logging is up so bad values are reported
    peerwatch::app::AppConfig config = peerwatch::app::LoadConfigFromEnv();

    // Create and initialize application
    // IMPORTANT: Use nested scope to ensure app destructor runs before LogManager::Shutdown()
    // This prevents race conditions where async callbacks try to log after logger is destroyed
    {
      peerwatch::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        return 1;
      }

      if (!app.start()) {
        LOG_ERROR("Failed to start application");
        return 1;
      }

      // Run until shutdown requested
      app.wait_for_shutdown();

      // app destructor runs here, stopping all network operations
    }

    // Shutdown logging AFTER app is fully destroyed
    peerwatch::util::LogManager::Shutdown();

    return 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    peerwatch::util::LogManager::Shutdown();
    return 1;
  }
}
