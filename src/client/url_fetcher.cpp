#include "client/url_fetcher.hpp"
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <system_error>
#include <boost/log/trivial.hpp>
#include <curl/curl.h>

namespace fileclient {
namespace client {

namespace {

struct CurlDeleter {
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

// Where a transfer writes. The file is created on the first byte of a
// successful response so that error bodies never land on disk.
struct Transfer {
  std::filesystem::path dest;
  FILE* output = nullptr;
  long status = 0;
  std::string reason;
  bool write_failed = false;

  ~Transfer() { close(); }

  void close() {
    if (output) {
      std::fclose(output);
      output = nullptr;
    }
  }

  bool open() {
    if (!output) {
      output = std::fopen(dest.c_str(), "wb");
    }
    return output != nullptr;
  }
};

size_t write_callback(char* data, size_t size, size_t nmemb, void* userp) {
  auto* transfer = static_cast<Transfer*>(userp);
  const size_t total = size * nmemb;

  if (transfer->status >= 400) {
    return total;
  }
  if (!transfer->open() || std::fwrite(data, 1, total, transfer->output) != total) {
    transfer->write_failed = true;
    return 0;
  }
  return total;
}

// Keeps the status line of the last response, redirects included
size_t header_callback(char* data, size_t size, size_t nmemb, void* userp) {
  auto* transfer = static_cast<Transfer*>(userp);
  const size_t total = size * nmemb;
  const std::string line(data, total);

  if (line.compare(0, 5, "HTTP/") == 0) {
    const auto code_start = line.find(' ');
    if (code_start != std::string::npos) {
      transfer->status = std::strtol(line.c_str() + code_start + 1, nullptr, 10);
      const auto reason_start = line.find(' ', code_start + 1);
      transfer->reason = reason_start == std::string::npos ? std::string() : line.substr(reason_start + 1);
      while (!transfer->reason.empty() && (transfer->reason.back() == '\r' || transfer->reason.back() == '\n')) {
        transfer->reason.pop_back();
      }
    }
  }
  return total;
}

void remove_partial(const std::filesystem::path& dest) {
  std::error_code ec;
  std::filesystem::remove(dest, ec);
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

UrlFetcher::UrlFetcher() {
  static std::once_flag curl_initialized;
  std::call_once(curl_initialized, [] { curl_global_init(CURL_GLOBAL_ALL); });
}


//==============================================
// FETCHING
//==============================================

void UrlFetcher::fetch(const paths::Url& url, const std::filesystem::path& dest) const {
  const std::string request_url = url.without_credentials();
  BOOST_LOG_TRIVIAL(info) << "URL fetcher: Fetching " << request_url << " to " << dest.string();

  CurlHandle handle(curl_easy_init());
  if (!handle) {
    throw errors::ForeignFetchError("Error reading " + request_url + ": failed to allocate curl handle");
  }

  Transfer transfer;
  transfer.dest = dest;
  char error_buffer[CURL_ERROR_SIZE] = {0};

  curl_easy_setopt(handle.get(), CURLOPT_URL, request_url.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_MAXREDIRS, 10L);
  curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT, CONNECT_TIMEOUT);
  curl_easy_setopt(handle.get(), CURLOPT_ERRORBUFFER, error_buffer);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &transfer);
  curl_easy_setopt(handle.get(), CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(handle.get(), CURLOPT_HEADERDATA, &transfer);

  if (url.has_credentials && (url.scheme == "http" || url.scheme == "https")) {
    BOOST_LOG_TRIVIAL(debug) << "URL fetcher: Using basic auth for " << url.host;
    curl_easy_setopt(handle.get(), CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
    curl_easy_setopt(handle.get(), CURLOPT_USERNAME, url.username.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_PASSWORD, url.password.c_str());
  }

  const CURLcode result = curl_easy_perform(handle.get());

  if (transfer.status >= 400) {
    transfer.close();
    remove_partial(dest);
    BOOST_LOG_TRIVIAL(error) << "URL fetcher: HTTP error " << transfer.status << " reading " << request_url;
    throw errors::ForeignFetchError("HTTP error " + std::to_string(transfer.status) + " reading " +
                                    request_url + ": " + transfer.reason);
  }

  if (result != CURLE_OK) {
    transfer.close();
    remove_partial(dest);
    const std::string reason = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(result);
    BOOST_LOG_TRIVIAL(error) << "URL fetcher: Error reading " << request_url << ": " << reason;
    throw errors::ForeignFetchError("Error reading " + request_url + ": " + reason);
  }

  // Empty bodies still produce a file
  if (!transfer.open()) {
    throw errors::ForeignFetchError("Error reading " + request_url + ": cannot write " + dest.string());
  }
  transfer.close();
  BOOST_LOG_TRIVIAL(debug) << "URL fetcher: Stored " << request_url << " at " << dest.string();
}

} // namespace client
} // namespace fileclient
