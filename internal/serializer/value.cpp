#include "value.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include "internal/util/errors.hpp"

namespace expiringdict::serializer {

Value NullValue() {
  Value v;
  v.set_null_value(google::protobuf::NULL_VALUE);
  return v;
}

Value StringValue(std::string_view s) {
  Value v;
  v.set_string_value(std::string(s));
  return v;
}

Value NumberValue(double n) {
  Value v;
  v.set_number_value(n);
  return v;
}

Value BoolValue(bool b) {
  Value v;
  v.set_bool_value(b);
  return v;
}

bool Equals(const Value& a, const Value& b) {
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

Value ParseJson(std::string_view json) {
  Value value;
  auto  status = google::protobuf::util::JsonStringToMessage(std::string(json), &value);
  if (!status.ok()) {
    throw util::SerializationError("invalid JSON value: " + std::string(status.message()));
  }
  return value;
}

std::string ToJson(const Value& value) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw util::SerializationError("cannot print value as JSON: " + std::string(status.message()));
  }
  return json;
}

} // namespace expiringdict::serializer
