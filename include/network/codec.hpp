#ifndef FILECLIENT_NETWORK_CODEC_HPP
#define FILECLIENT_NETWORK_CODEC_HPP

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <boost/endian/conversion.hpp>
#include "network/load.hpp"

namespace fileclient {
namespace network {

class CodecError : public std::runtime_error {
public:
  explicit CodecError(const std::string& message) : std::runtime_error(message) {}
};

// Binary serializer for Load payloads. Integers travel big endian:
//   u32 field_count, then per field: u32 key_len, key, u8 tag, value
class Codec {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Codec() = default;


  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Serializes a load to an output stream, returns bytes written
  std::size_t serialize(const Load& load, std::ostream& output) const;
  std::string serialize(const Load& load) const;
  // Deserializes a load, throws CodecError on truncated or unknown input
  Load deserialize(std::istream& input) const;
  Load deserialize(const std::string& data) const;

private:
  // Upper bound for any single string or count, guards against corrupt lengths
  static constexpr uint64_t MAX_LENGTH = 1ULL << 32;


  // ---- STREAM OPERATIONS ----
  void write_bytes(std::ostream& output, const void* data, std::size_t size) const;
  void read_bytes(std::istream& input, void* data, std::size_t size) const;

  std::size_t write_u32(std::ostream& output, uint32_t value) const;
  std::size_t write_u64(std::ostream& output, uint64_t value) const;
  std::size_t write_string(std::ostream& output, const std::string& value) const;
  std::size_t write_list(std::ostream& output, const StringList& list) const;
  std::size_t write_field(std::ostream& output, const Field& field) const;

  uint32_t read_u32(std::istream& input) const;
  uint64_t read_u64(std::istream& input) const;
  std::string read_string(std::istream& input) const;
  StringList read_list(std::istream& input) const;
  Field read_field(std::istream& input) const;
};

} // namespace network
} // namespace fileclient

#endif // FILECLIENT_NETWORK_CODEC_HPP
