#include "network/codec.hpp"
#include <boost/log/trivial.hpp>
#include <sstream>
#include <type_traits>

namespace fileclient {
namespace network {

//==============================================
// SERIALIZATION AND DESERIALIZATION
//==============================================

std::size_t Codec::serialize(const Load& load, std::ostream& output) const {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid output stream state";
    throw CodecError("Codec: Invalid output stream");
  }

  std::size_t total_bytes = write_u32(output, static_cast<uint32_t>(load.size()));

  for (const auto& [key, field] : load.fields()) {
    total_bytes += write_u32(output, static_cast<uint32_t>(key.size()));
    write_bytes(output, key.data(), key.size());
    total_bytes += key.size();

    const auto tag = static_cast<uint8_t>(field.index());
    write_bytes(output, &tag, sizeof(tag));
    total_bytes += sizeof(tag);

    total_bytes += write_field(output, field);
  }

  output.flush();
  BOOST_LOG_TRIVIAL(trace) << "Codec: Serialized " << load.size() << " fields into " << total_bytes << " bytes";
  return total_bytes;
}

std::string Codec::serialize(const Load& load) const {
  std::ostringstream output;
  serialize(load, output);
  return output.str();
}

Load Codec::deserialize(std::istream& input) const {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid input stream state";
    throw CodecError("Codec: Invalid input stream");
  }

  Load load;
  const uint32_t field_count = read_u32(input);

  for (uint32_t i = 0; i < field_count; ++i) {
    const uint32_t key_length = read_u32(input);
    if (key_length > MAX_LENGTH) {
      throw CodecError("Codec: Key length out of range");
    }
    std::string key(key_length, '\0');
    read_bytes(input, &key[0], key_length);
    load.set(key, read_field(input));
  }

  BOOST_LOG_TRIVIAL(trace) << "Codec: Deserialized " << field_count << " fields";
  return load;
}

Load Codec::deserialize(const std::string& data) const {
  std::istringstream input(data);
  return deserialize(input);
}


//==============================================
// FIELD ENCODING
//==============================================

std::size_t Codec::write_field(std::ostream& output, const Field& field) const {
  return std::visit([this, &output](const auto& value) -> std::size_t {
    using T = std::decay_t<decltype(value)>;

    if constexpr (std::is_same_v<T, bool>) {
      const uint8_t byte = value ? 1 : 0;
      write_bytes(output, &byte, sizeof(byte));
      return sizeof(byte);
    } else if constexpr (std::is_same_v<T, int64_t>) {
      return write_u64(output, static_cast<uint64_t>(value));
    } else if constexpr (std::is_same_v<T, std::string>) {
      return write_string(output, value);
    } else if constexpr (std::is_same_v<T, StringList>) {
      return write_list(output, value);
    } else {
      std::size_t written = write_u32(output, static_cast<uint32_t>(value.size()));
      for (const auto& [name, list] : value) {
        written += write_string(output, name);
        written += write_list(output, list);
      }
      return written;
    }
  }, field);
}

Field Codec::read_field(std::istream& input) const {
  uint8_t tag;
  read_bytes(input, &tag, sizeof(tag));

  switch (static_cast<FieldType>(tag)) {
    case FieldType::BOOL: {
      uint8_t byte;
      read_bytes(input, &byte, sizeof(byte));
      return byte != 0;
    }
    case FieldType::INT:
      return static_cast<int64_t>(read_u64(input));
    case FieldType::BYTES:
      return read_string(input);
    case FieldType::LIST:
      return read_list(input);
    case FieldType::MAP: {
      StringListMap map;
      const uint32_t count = read_u32(input);
      for (uint32_t i = 0; i < count; ++i) {
        std::string name = read_string(input);
        map[name] = read_list(input);
      }
      return map;
    }
    default:
      BOOST_LOG_TRIVIAL(error) << "Codec: Unknown field tag: " << static_cast<int>(tag);
      throw CodecError("Codec: Unknown field tag");
  }
}

std::size_t Codec::write_string(std::ostream& output, const std::string& value) const {
  std::size_t written = write_u64(output, value.size());
  write_bytes(output, value.data(), value.size());
  return written + value.size();
}

std::size_t Codec::write_list(std::ostream& output, const StringList& list) const {
  std::size_t written = write_u32(output, static_cast<uint32_t>(list.size()));
  for (const auto& item : list) {
    written += write_string(output, item);
  }
  return written;
}

std::string Codec::read_string(std::istream& input) const {
  const uint64_t length = read_u64(input);
  if (length > MAX_LENGTH) {
    BOOST_LOG_TRIVIAL(error) << "Codec: String length out of range: " << length;
    throw CodecError("Codec: String length out of range");
  }
  std::string value(length, '\0');
  if (length > 0) {
    read_bytes(input, &value[0], length);
  }
  return value;
}

StringList Codec::read_list(std::istream& input) const {
  const uint32_t count = read_u32(input);
  StringList list;
  for (uint32_t i = 0; i < count; ++i) {
    list.push_back(read_string(input));
  }
  return list;
}


//==============================================
// STREAM OPERATIONS
//==============================================

std::size_t Codec::write_u32(std::ostream& output, uint32_t value) const {
  const uint32_t network_value = boost::endian::native_to_big(value);
  write_bytes(output, &network_value, sizeof(network_value));
  return sizeof(network_value);
}

std::size_t Codec::write_u64(std::ostream& output, uint64_t value) const {
  const uint64_t network_value = boost::endian::native_to_big(value);
  write_bytes(output, &network_value, sizeof(network_value));
  return sizeof(network_value);
}

uint32_t Codec::read_u32(std::istream& input) const {
  uint32_t network_value;
  read_bytes(input, &network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

uint64_t Codec::read_u64(std::istream& input) const {
  uint64_t network_value;
  read_bytes(input, &network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

void Codec::write_bytes(std::ostream& output, const void* data, std::size_t size) const {
  if (!output.write(static_cast<const char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to write " << size << " bytes to output stream";
    throw CodecError("Codec: Failed to write to output stream");
  }
}

void Codec::read_bytes(std::istream& input, void* data, std::size_t size) const {
  if (!input.read(static_cast<char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to read " << size << " bytes from input stream";
    throw CodecError("Codec: Failed to read from input stream");
  }
}

} // namespace network
} // namespace fileclient
