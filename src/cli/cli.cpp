#include "cli/cli.hpp"
#include <sstream>
#include <boost/log/trivial.hpp>

namespace fileclient {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(client::Client& client, const std::string& env, std::istream& input, std::ostream& output)
  : running_(false)
  , env_(env)
  , client_(client)
  , input_(input)
  , output_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized for environment " << env_;
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  output_ << "fileclient> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    if (line == "quit") {
      running_ = false;
      continue;
    }

    std::istringstream iss(line);
    std::string command, first, second;
    iss >> command >> first >> second;

    if (!command.empty()) {
      try {
        process_command(command, first, second);
      } catch (const std::exception& e) {
        log_and_display_error("Error running " + command, e.what());
      }
    }

    if (running_) {
      output_ << "fileclient> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::string& first, const std::string& second) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " " << first << " " << second;

  if (command == "help") {
    handle_help_command();
  }
  else if (command == "file_list") {
    print_listing(client_.file_list(env_));
  }
  else if (command == "dir_list") {
    print_listing(client_.dir_list(env_));
  }
  else if (command == "emptydirs") {
    print_listing(client_.file_list_emptydirs(env_));
  }
  else if (command == "local_list") {
    print_paths(client_.file_local_list(env_));
  }
  else if (command == "list_states") {
    print_paths(client_.list_states(env_));
  }
  else if (command == "env" && !first.empty()) {
    env_ = first;
    output_ << "Environment set to " << env_ << std::endl;
  }
  else if (command == "cache_file" && !first.empty()) {
    print_path(client_.cache_file(first, env_), "Could not cache " + first);
  }
  else if (command == "cache_dir" && !first.empty()) {
    print_paths(client_.cache_dir(first, env_));
  }
  else if (command == "cache_local_file" && !first.empty()) {
    print_path(client_.cache_local_file(first), "Could not cache " + first);
  }
  else if (command == "is_cached" && !first.empty()) {
    print_path(client_.is_cached(first, env_), "Not cached: " + first);
  }
  else if (command == "hash_file" && !first.empty()) {
    handle_hash_command(first);
  }
  else if (command == "get_state" && !first.empty()) {
    handle_get_state_command(first);
  }
  else if (command == "get_url" && !first.empty()) {
    handle_get_url_command(first, second);
  }
  else if (command == "get_file" && !first.empty() && !second.empty()) {
    handle_get_file_command(first, second);
  }
  else if (command == "get_dir" && !first.empty() && !second.empty()) {
    handle_get_dir_command(first, second);
  }
  else {
    output_ << "Unknown command or invalid arguments" << std::endl;
  }
}

void CLI::handle_get_file_command(const std::string& path, const std::string& dest) {
  const auto result = client_.get_file(path, dest, true, env_);
  if (result.ok()) {
    output_ << result.path.string() << std::endl;
  } else {
    output_ << "Failed to fetch " << path << ": " << client::fetch_status_to_string(result.status) << std::endl;
  }
}

void CLI::handle_get_dir_command(const std::string& path, const std::string& dest) {
  print_paths(client_.get_dir(path, dest, env_));
}

void CLI::handle_get_url_command(const std::string& url, const std::string& dest) {
  print_path(client_.get_url(url, dest, true, env_), "Could not fetch " + url);
}

void CLI::handle_hash_command(const std::string& path) {
  const auto digest = client_.hash_file(path, env_);
  if (!digest) {
    output_ << "No hash available for " << path << std::endl;
    return;
  }
  output_ << digest->hash_type << " " << digest->hsum << std::endl;
}

void CLI::handle_get_state_command(const std::string& sls) {
  const auto state = client_.get_state(sls, env_);
  if (!state) {
    output_ << "No state " << sls << " in " << env_ << std::endl;
    return;
  }
  output_ << state->source << " -> " << state->dest << std::endl;
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                      Display this help message" << std::endl;
  output_ << "  cache_file <url>          Cache a salt:// path or a URL" << std::endl;
  output_ << "  get_file <path> <dest>    Fetch a salt:// path to <dest>" << std::endl;
  output_ << "  cache_dir <path>          Cache every file below a salt:// directory" << std::endl;
  output_ << "  get_dir <path> <dest>     Copy a salt:// directory below <dest>" << std::endl;
  output_ << "  get_url <url> [dest]      Fetch a URL, into the cache without dest" << std::endl;
  output_ << "  cache_local_file <path>   Copy a local file into the cache" << std::endl;
  output_ << "  is_cached <path>          Show where <path> is cached" << std::endl;
  output_ << "  hash_file <path>          Hash a salt:// path or local file" << std::endl;
  output_ << "  file_list                 List files of the environment" << std::endl;
  output_ << "  dir_list                  List directories of the environment" << std::endl;
  output_ << "  emptydirs                 List empty directories of the environment" << std::endl;
  output_ << "  local_list                List cached files" << std::endl;
  output_ << "  list_states               List state modules" << std::endl;
  output_ << "  get_state <sls>           Cache a state file" << std::endl;
  output_ << "  env <name>                Switch environment" << std::endl;
  output_ << "  quit                      Exit the shell" << std::endl << std::endl;
}

void CLI::print_path(const std::string& path, const std::string& missing_message) {
  output_ << (path.empty() ? missing_message : path) << std::endl;
}

void CLI::print_listing(const client::Listing& listing) {
  if (!listing) {
    output_ << "Master unreachable" << std::endl;
    return;
  }
  print_paths(*listing);
}

void CLI::print_paths(const std::vector<std::string>& paths) {
  for (const auto& path : paths) {
    output_ << path << std::endl;
  }
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace fileclient
