#include "wayfarer/encoder.hpp"

#include <memory>

#include "wayfarer/compression-config.hpp"
#include "wayfarer/encoding.hpp"

#ifdef WAYFARER_ENABLE_ZLIB
#include "wayfarer/zlib-encoder.hpp"
#endif
#ifdef WAYFARER_ENABLE_BROTLI
#include "wayfarer/brotli-encoder.hpp"
#endif
#ifdef WAYFARER_ENABLE_ZSTD
#include "wayfarer/zstd-encoder.hpp"
#endif

namespace wayfarer {

std::unique_ptr<Encoder> MakeEncoder([[maybe_unused]] Encoding encoding,
                                     [[maybe_unused]] const CompressionConfig &config) {
  switch (encoding) {
#ifdef WAYFARER_ENABLE_ZLIB
    case Encoding::gzip:
      return std::make_unique<ZlibEncoder>(ZStreamRAII::Variant::gzip, config);
    case Encoding::deflate:
      return std::make_unique<ZlibEncoder>(ZStreamRAII::Variant::deflate, config);
#endif
#ifdef WAYFARER_ENABLE_BROTLI
    case Encoding::br:
      return std::make_unique<BrotliEncoder>(config);
#endif
#ifdef WAYFARER_ENABLE_ZSTD
    case Encoding::zstd:
      return std::make_unique<ZstdEncoder>(config);
#endif
    default:
      return nullptr;
  }
}

}  // namespace wayfarer
