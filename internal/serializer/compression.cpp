#include "compression.hpp"

#include <arrow/result.h>
#include <arrow/status.h>
#include <arrow/util/compression.h>

#include <cstdint>
#include <memory>

#include "internal/util/errors.hpp"

namespace expiringdict::serializer {
namespace {

/*
  Helper: unwrap Arrow Result<T> or throw
*/
template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw util::SerializationError(result.status().ToString());
  return std::move(result).ValueOrDie();
}

const uint8_t* Bytes(std::string_view s) {
  return reinterpret_cast<const uint8_t*>(s.data());
}

// Arrow's GZIP codec in ZLIB framing; same stream as zlib's compress()
std::unique_ptr<arrow::util::Codec> MakeZlibCodec() {
  arrow::util::GZipCodecOptions options;
  options.gzip_format = arrow::util::GZipFormat::ZLIB;
  return Unwrap(arrow::util::Codec::Create(arrow::Compression::GZIP, options));
}

} // namespace

std::string ZlibCompress(std::string_view data) {
  auto codec = MakeZlibCodec();

  const auto  input_len = static_cast<int64_t>(data.size());
  const auto  max_len   = codec->MaxCompressedLen(input_len, Bytes(data));
  std::string out(static_cast<size_t>(max_len), '\0');

  const int64_t written = Unwrap(
      codec->Compress(input_len, Bytes(data), max_len, reinterpret_cast<uint8_t*>(out.data())));
  out.resize(static_cast<size_t>(written));
  return out;
}

std::string ZlibDecompress(std::string_view data) {
  auto codec        = MakeZlibCodec();
  auto decompressor = Unwrap(codec->MakeDecompressor());

  // the stream does not record its decompressed size; grow until done
  std::string out(data.size() * 4 + 64, '\0');
  size_t      in_pos  = 0;
  size_t      out_pos = 0;

  while (!decompressor->IsFinished()) {
    if (out_pos == out.size()) out.resize(out.size() * 2);

    auto r = Unwrap(decompressor->Decompress(static_cast<int64_t>(data.size() - in_pos), Bytes(data) + in_pos,
                                             static_cast<int64_t>(out.size() - out_pos),
                                             reinterpret_cast<uint8_t*>(out.data()) + out_pos));
    in_pos += static_cast<size_t>(r.bytes_read);
    out_pos += static_cast<size_t>(r.bytes_written);

    if (r.bytes_read == 0 && r.bytes_written == 0) {
      if (in_pos == data.size()) {
        throw util::SerializationError("truncated zlib stream");
      }
      // no room left to make progress
      out.resize(out.size() * 2);
    }
  }

  out.resize(out_pos);
  return out;
}

std::string Tag(std::string_view data) {
  std::string compressed = ZlibCompress(data);

  std::string out;
  if (compressed.size() < data.size()) {
    out.reserve(compressed.size() + 1);
    out.push_back(kCompressedTag);
    out.append(compressed);
  } else {
    out.reserve(data.size() + 1);
    out.push_back(kRawTag);
    out.append(data);
  }
  return out;
}

std::string Untag(std::string_view tagged) {
  if (tagged.empty()) {
    throw util::SerializationError("empty stored value");
  }

  const char flag = tagged.front();
  tagged.remove_prefix(1);

  switch (flag) {
    case kCompressedTag:
      return ZlibDecompress(tagged);
    case kRawTag:
      return std::string(tagged);
    default:
      throw util::SerializationError(std::string("unknown value tag '") + flag + "'");
  }
}

} // namespace expiringdict::serializer
