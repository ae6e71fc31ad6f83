#include "utils/gzip.hpp"
#include <array>
#include <cstring>
#include <zlib.h>
#include <boost/log/trivial.hpp>

namespace fileclient {
namespace utils {

namespace {

// windowBits offset selecting the gzip wrapper instead of raw zlib
constexpr int GZIP_WINDOW_BITS = 15 + 16;

// Ends the zlib stream on every exit path
struct StreamGuard {
  z_stream& strm;
  bool inflating;
  ~StreamGuard() {
    if (inflating) {
      inflateEnd(&strm);
    } else {
      deflateEnd(&strm);
    }
  }
};

} // namespace

std::string gzip_compress(const std::string& data, int level) {
  z_stream strm;
  std::memset(&strm, 0, sizeof(strm));

  if (deflateInit2(&strm, level, Z_DEFLATED, GZIP_WINDOW_BITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
    throw GzipError("Gzip: Failed to initialize compressor");
  }
  StreamGuard guard{strm, false};

  strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  strm.avail_in = static_cast<uInt>(data.size());

  std::string output;
  std::array<char, 16384> buffer;
  int result = Z_OK;
  do {
    strm.next_out = reinterpret_cast<Bytef*>(buffer.data());
    strm.avail_out = static_cast<uInt>(buffer.size());
    result = deflate(&strm, Z_FINISH);
    if (result == Z_STREAM_ERROR) {
      throw GzipError("Gzip: Compression failed");
    }
    output.append(buffer.data(), buffer.size() - strm.avail_out);
  } while (result != Z_STREAM_END);

  return output;
}

std::string gzip_uncompress(const std::string& data) {
  z_stream strm;
  std::memset(&strm, 0, sizeof(strm));

  if (inflateInit2(&strm, GZIP_WINDOW_BITS) != Z_OK) {
    throw GzipError("Gzip: Failed to initialize decompressor");
  }
  StreamGuard guard{strm, true};

  strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  strm.avail_in = static_cast<uInt>(data.size());

  std::string output;
  std::array<char, 16384> buffer;
  while (true) {
    strm.next_out = reinterpret_cast<Bytef*>(buffer.data());
    strm.avail_out = static_cast<uInt>(buffer.size());
    const int result = inflate(&strm, Z_NO_FLUSH);

    if (result != Z_OK && result != Z_STREAM_END) {
      BOOST_LOG_TRIVIAL(error) << "Gzip: Corrupt compressed chunk, zlib code " << result;
      throw GzipError("Gzip: Corrupt compressed data");
    }
    output.append(buffer.data(), buffer.size() - strm.avail_out);

    if (result == Z_STREAM_END) {
      if (strm.avail_in == 0) {
        break;
      }
      // Concatenated members decode as one stream
      if (inflateReset(&strm) != Z_OK) {
        throw GzipError("Gzip: Failed to reset decompressor");
      }
      continue;
    }

    // Input exhausted before the gzip trailer
    if (strm.avail_in == 0 && strm.avail_out != 0) {
      throw GzipError("Gzip: Truncated compressed data");
    }
  }

  return output;
}

} // namespace utils
} // namespace fileclient
