#include "client/remote_backend.hpp"
#include "network/codec.hpp"
#include "paths/path_resolver.hpp"
#include "utils/gzip.hpp"
#include <system_error>
#include <boost/log/trivial.hpp>

namespace fileclient {
namespace client {

//==============================================
// FETCH SESSION
//==============================================

FetchSession::~FetchSession() {
  close();
}

void FetchSession::open(const std::filesystem::path& dest) {
  close();
  dest_ = dest;
  output_.open(dest_, std::ios::binary | std::ios::trunc);
  if (!output_) {
    BOOST_LOG_TRIVIAL(error) << "Remote client: Failed to open " << dest_.string() << " for writing";
    throw store::StoreError("Remote client: Failed to open file: " + dest_.string());
  }
  offset_ = 0;
}

void FetchSession::write(const std::string& data) {
  output_.write(data.data(), static_cast<std::streamsize>(data.size()));
  if (!output_) {
    throw store::StoreError("Remote client: Failed to write file: " + dest_.string());
  }
  offset_ += data.size();
}

void FetchSession::flush() {
  if (output_.is_open()) {
    output_.flush();
  }
}

void FetchSession::close() {
  if (output_.is_open()) {
    output_.close();
  }
}

void FetchSession::restart() {
  const auto dest = dest_;
  open(dest);
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

RemoteBackend::RemoteBackend(const config::Config& config, std::unique_ptr<network::MasterChannel> master)
  : config_(config),
    master_(std::move(master)),
    store_(config.cachedir) {
  BOOST_LOG_TRIVIAL(info) << "Remote client: Using master " << config_.master << ":" << config_.master_port;
}


//==============================================
// FETCHING
//==============================================

FetchResult RemoteBackend::get_file(const std::string& path, const std::string& dest, bool makedirs,
                                    const std::string& env, int gzip) {
  BOOST_LOG_TRIVIAL(info) << "Remote client: Fetching file '" << path << "'";
  const std::string relative = paths::strip_scheme(path);

  network::Load load;
  load.set("path", relative);
  load.set("env", env);
  load.set("cmd", "_serve_file");
  if (gzip > 0) {
    load.set("gzip", gzip);
  }

  FetchSession session;
  if (!dest.empty()) {
    const std::filesystem::path dest_path(dest);
    std::filesystem::path destdir = dest_path.parent_path();
    if (destdir.empty()) {
      destdir = ".";
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(destdir, ec)) {
      if (!makedirs) {
        BOOST_LOG_TRIVIAL(warning) << "Remote client: Destination directory " << destdir.string() << " does not exist";
        return FetchResult::failure(FetchStatus::DESTINATION_UNAVAILABLE);
      }
      std::filesystem::create_directories(destdir);
    }
    session.open(dest_path);
  }

  while (true) {
    load.set("loc", static_cast<int64_t>(session.offset()));

    network::Load reply;
    try {
      reply = master_->query(load);
    } catch (const network::TransportTimeoutError& e) {
      BOOST_LOG_TRIVIAL(error) << "Remote client: Timed out fetching " << path << ": " << e.what();
      return FetchResult::failure(FetchStatus::TIMEOUT);
    }

    const std::string data = reply.get_string("data");
    if (data.empty()) {
      if (!session.is_open()) {
        const std::string reply_dest = reply.get_string("dest");
        if (reply_dest.empty()) {
          BOOST_LOG_TRIVIAL(info) << "Remote client: Master has no file " << path << " in " << env;
          return FetchResult::failure(FetchStatus::NOT_FOUND);
        }
        // Zero byte file on the master
        open_cache_destination(session, env, reply_dest);
      }

      if (reply.has("hsum")) {
        session.flush();
        session.count_attempt();

        const crypto::DigestRecord expected{
          reply.get_string("hash_type", crypto::DEFAULT_HASH_TYPE),
          reply.get_string("hsum")
        };
        if (!crypto::verify_file(session.dest(), expected)) {
          if (session.attempts() < MAX_VERIFY_ATTEMPTS) {
            BOOST_LOG_TRIVIAL(warning) << "Remote client: Bad download of file " << path << ", attempt "
                                       << session.attempts() << " of " << MAX_VERIFY_ATTEMPTS;
            session.restart();
            continue;
          }
          BOOST_LOG_TRIVIAL(warning) << "Remote client: Bad download of file " << path << ", attempt "
                                     << session.attempts() << " of " << MAX_VERIFY_ATTEMPTS
                                     << ", keeping unverified file " << session.dest().string();
        }
      }
      break;
    }

    if (!session.is_open()) {
      const std::string reply_dest = reply.get_string("dest");
      open_cache_destination(session, env, reply_dest.empty() ? relative : reply_dest);
    }

    if (gzip > 0 && reply.get_bool("gzip")) {
      session.write(utils::gzip_uncompress(data));
    } else {
      session.write(data);
    }
  }

  session.close();
  BOOST_LOG_TRIVIAL(debug) << "Remote client: Stored " << session.offset() << " bytes at " << session.dest().string();
  return FetchResult::success(session.dest());
}


//==============================================
// LISTINGS
//==============================================

Listing RemoteBackend::file_list(const std::string& env) {
  return list_command("_file_list", env);
}

Listing RemoteBackend::dir_list(const std::string& env) {
  return list_command("_dir_list", env);
}

Listing RemoteBackend::file_list_emptydirs(const std::string& env) {
  return list_command("_file_list_emptydirs", env);
}

Listing RemoteBackend::list_env(const std::string& env) {
  return list_command("_file_list", env);
}


//==============================================
// METADATA
//==============================================

std::optional<crypto::DigestRecord> RemoteBackend::hash_file(const std::string& path, const std::string& env) {
  if (!paths::has_scheme(path)) {
    return crypto::digest_file(path, crypto::DEFAULT_HASH_TYPE);
  }

  network::Load load;
  load.set("path", paths::strip_scheme(path));
  load.set("env", env);
  load.set("cmd", "_file_hash");

  try {
    const network::Load reply = master_->query(load);
    const std::string hsum = reply.get_string("hsum");
    if (hsum.empty()) {
      return std::nullopt;
    }
    return crypto::DigestRecord{reply.get_string("hash_type", config_.hash_type), hsum};
  } catch (const network::TransportTimeoutError& e) {
    BOOST_LOG_TRIVIAL(error) << "Remote client: Timed out hashing " << path << ": " << e.what();
    return std::nullopt;
  }
}

std::optional<network::Load> RemoteBackend::master_opts() {
  network::Load load;
  load.set("cmd", "_master_opts");

  try {
    return master_->query(load);
  } catch (const network::TransportTimeoutError& e) {
    BOOST_LOG_TRIVIAL(error) << "Remote client: Timed out reading master options: " << e.what();
    return std::nullopt;
  }
}

std::optional<network::StringListMap> RemoteBackend::ext_nodes() {
  network::Load load;
  load.set("cmd", "_ext_nodes");
  load.set("id", config_.id);
  // The master runs the classifier with the minion's options, nested as an encoded load
  load.set("opts", network::Codec().serialize(config::to_load(config_)));

  try {
    return master_->query(load).get_map("return");
  } catch (const network::TransportTimeoutError& e) {
    BOOST_LOG_TRIVIAL(error) << "Remote client: Timed out reading external nodes: " << e.what();
    return std::nullopt;
  }
}


//==============================================
// UTILITY METHODS
//==============================================

Listing RemoteBackend::list_command(const std::string& command, const std::string& env) {
  network::Load load;
  load.set("env", env);
  load.set("cmd", command);

  try {
    return master_->query(load).get_list("return");
  } catch (const network::TransportTimeoutError& e) {
    BOOST_LOG_TRIVIAL(error) << "Remote client: " << command << " for " << env << " timed out: " << e.what();
    return std::nullopt;
  }
}

void RemoteBackend::open_cache_destination(FetchSession& session, const std::string& env,
                                           const std::string& relative) {
  const auto cache_dest = store_.cache_destination(env, relative);

  std::error_code ec;
  if (std::filesystem::is_directory(cache_dest, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "Remote client: Removing directory cached at " << cache_dest.string();
    std::filesystem::remove_all(cache_dest);
  }
  session.open(cache_dest);
}

} // namespace client
} // namespace fileclient
