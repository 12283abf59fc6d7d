#pragma once

#include <string>
#include <string_view>

#include "value.hpp"

namespace expiringdict::serializer {

// bytes in, same bytes out
struct RawSerializer {
  using value_type = std::string;

  std::string Dumps(const std::string& value) const {
    return value;
  }

  std::string Loads(std::string_view bytes) const {
    return std::string(bytes);
  }
};

// Value in protobuf binary encoding
struct ValueSerializer {
  using value_type = Value;

  std::string Dumps(const Value& value) const;
  Value       Loads(std::string_view bytes) const;
};

// Value as JSON text; readable with sqlite3 and other tools
struct JsonSerializer {
  using value_type = Value;

  std::string Dumps(const Value& value) const;
  Value       Loads(std::string_view bytes) const;
};

} // namespace expiringdict::serializer
