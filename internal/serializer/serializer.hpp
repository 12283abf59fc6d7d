#pragma once

#include <concepts>
#include <string>
#include <string_view>

namespace expiringdict::serializer {

/*
  Value codec contract.

  Any type with a value_type and Dumps/Loads of this shape can back a
  Connection; no base class is involved. Loads(Dumps(v)) must equal v for
  every v the codec accepts. Dumps output is stored as a BLOB.
*/
template <typename S>
concept Serializer = requires(const S& s, const typename S::value_type& value, std::string_view bytes) {
  typename S::value_type;
  { s.Dumps(value) } -> std::convertible_to<std::string>;
  { s.Loads(bytes) } -> std::convertible_to<typename S::value_type>;
};

} // namespace expiringdict::serializer
