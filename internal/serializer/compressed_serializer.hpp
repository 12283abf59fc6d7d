#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "codecs.hpp"
#include "compression.hpp"
#include "serializer.hpp"

namespace expiringdict::serializer {

/*
  Serializes with Inner, then zlib-compresses when that saves space.

  Stored layout: one tag byte ('Z' compressed, 'R' raw) followed by the
  payload. The tag byte is part of the on-disk format.
*/
template <Serializer Inner>
class CompressedSerializer {
 public:
  using value_type = typename Inner::value_type;

  CompressedSerializer() = default;
  explicit CompressedSerializer(Inner inner) : inner_(std::move(inner)) {
  }

  std::string Dumps(const value_type& value) const {
    return Tag(inner_.Dumps(value));
  }

  value_type Loads(std::string_view bytes) const {
    return inner_.Loads(Untag(bytes));
  }

 private:
  Inner inner_;
};

using DefaultSerializer = CompressedSerializer<ValueSerializer>;

static_assert(Serializer<RawSerializer>);
static_assert(Serializer<ValueSerializer>);
static_assert(Serializer<JsonSerializer>);
static_assert(Serializer<DefaultSerializer>);

} // namespace expiringdict::serializer
