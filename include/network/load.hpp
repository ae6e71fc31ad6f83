#ifndef FILECLIENT_NETWORK_LOAD_HPP
#define FILECLIENT_NETWORK_LOAD_HPP

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace fileclient {
namespace network {

using StringList = std::vector<std::string>;
using StringListMap = std::map<std::string, StringList>;

// Wire type tags, the order matches the Field alternatives
enum class FieldType : uint8_t {
    BOOL = 0,
    INT = 1,
    BYTES = 2,
    LIST = 3,
    MAP = 4
};

using Field = std::variant<bool, int64_t, std::string, StringList, StringListMap>;

// Keyed payload of one request or reply exchanged with the master
class Load {
public:
    Load() = default;

    void set(const std::string& key, Field value) { fields_[key] = std::move(value); }
    // Keep literals away from the bool alternative
    void set(const std::string& key, const char* value) { fields_[key] = std::string(value); }
    void set(const std::string& key, const std::string& value) { fields_[key] = value; }
    void set(const std::string& key, bool value) { fields_[key] = value; }
    void set(const std::string& key, int value) { fields_[key] = static_cast<int64_t>(value); }
    void set(const std::string& key, int64_t value) { fields_[key] = value; }
    bool has(const std::string& key) const { return fields_.count(key) != 0; }
    void erase(const std::string& key) { fields_.erase(key); }
    bool empty() const { return fields_.empty(); }
    std::size_t size() const { return fields_.size(); }

    // Typed accessors return the fallback when the key is missing or holds another type
    std::string get_string(const std::string& key, const std::string& fallback = "") const {
        return get_or<std::string>(key, fallback);
    }
    int64_t get_int(const std::string& key, int64_t fallback = 0) const {
        return get_or<int64_t>(key, fallback);
    }
    bool get_bool(const std::string& key, bool fallback = false) const {
        // Masters may flag booleans as integers
        auto it = fields_.find(key);
        if (it != fields_.end() && std::holds_alternative<int64_t>(it->second)) {
            return std::get<int64_t>(it->second) != 0;
        }
        return get_or<bool>(key, fallback);
    }
    StringList get_list(const std::string& key) const {
        return get_or<StringList>(key, StringList{});
    }
    StringListMap get_map(const std::string& key) const {
        return get_or<StringListMap>(key, StringListMap{});
    }

    const std::map<std::string, Field>& fields() const { return fields_; }

    bool operator==(const Load& other) const { return fields_ == other.fields_; }

private:
    std::map<std::string, Field> fields_;

    template <typename T>
    T get_or(const std::string& key, const T& fallback) const {
        auto it = fields_.find(key);
        if (it == fields_.end()) {
            return fallback;
        }
        if (const T* value = std::get_if<T>(&it->second)) {
            return *value;
        }
        return fallback;
    }
};

} // namespace network
} // namespace fileclient

#endif // FILECLIENT_NETWORK_LOAD_HPP
