#pragma once

#include <string>
#include <string_view>

namespace expiringdict::serializer {

inline constexpr char kCompressedTag = 'Z';
inline constexpr char kRawTag        = 'R';

// zlib stream (RFC 1950) of `data`
std::string ZlibCompress(std::string_view data);
std::string ZlibDecompress(std::string_view data);

// 'Z' + compressed when that is strictly smaller, else 'R' + data
std::string Tag(std::string_view data);

// inverse of Tag(); throws util::SerializationError on an unknown tag
std::string Untag(std::string_view tagged);

} // namespace expiringdict::serializer
