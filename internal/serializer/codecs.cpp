#include "codecs.hpp"

#include "internal/util/errors.hpp"

namespace expiringdict::serializer {

std::string ValueSerializer::Dumps(const Value& value) const {
  std::string out;
  if (!value.SerializeToString(&out)) {
    throw util::SerializationError("failed to serialize value");
  }
  return out;
}

Value ValueSerializer::Loads(std::string_view bytes) const {
  Value value;
  if (!value.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
    throw util::SerializationError("stored value is not a serialized Value");
  }
  return value;
}

std::string JsonSerializer::Dumps(const Value& value) const {
  return ToJson(value);
}

Value JsonSerializer::Loads(std::string_view bytes) const {
  return ParseJson(bytes);
}

} // namespace expiringdict::serializer
