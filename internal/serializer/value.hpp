#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>
#include <string_view>

namespace expiringdict::serializer {

/*
  Dynamic value stored by the default codecs: null, number, string,
  bool, list or struct (google.protobuf.Value).
*/
using Value = google::protobuf::Value;

Value NullValue();
Value StringValue(std::string_view s);
Value NumberValue(double n);
Value BoolValue(bool b);

// deep equality; numbers compare exactly
bool Equals(const Value& a, const Value& b);

// JSON text <-> Value; throws util::SerializationError on malformed input
Value       ParseJson(std::string_view json);
std::string ToJson(const Value& value);

} // namespace expiringdict::serializer
