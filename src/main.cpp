#include "cli/cli.hpp"
#include "client/client.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include <iostream>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  std::string config_file;
  std::string env{fileclient::paths::DEFAULT_ENV};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -c <config> [-e <environment>]\n"
            << "Required arguments:\n"
            << "  -c, --config  Configuration file (YAML)\n"
            << "Optional arguments:\n"
            << "  -e, --env     Environment, defaults to base\n"
            << "Example: " << program_name << " -c /etc/fileclient/minion.yaml -e base\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> flags = {"-c", "--config", "-e", "--env"};

  ProgramOptions options;

  for (int i = 1; i < argc; i += 2) {
    const std::string flag(argv[i]);

    if (flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    const std::string value(argv[i + 1]);
    if (flag == "-c" || flag == "--config") {
      options.config_file = value;
    } else {
      options.env = value;
    }
  }

  if (options.config_file.empty()) {
    std::cerr << "Error: A configuration file is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  try {
    const auto config = fileclient::config::load_config(options.config_file);
    fileclient::logger::init_logging(config.log_file, config.log_level);

    auto client = fileclient::client::make_client(config);
    fileclient::cli::CLI cli(*client, options.env);
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start file client: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
