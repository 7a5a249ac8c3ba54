#include "wayfarer/zlib-stream-raii.hpp"

#include <zconf.h>
#include <zlib.h>

#include <cstdint>
#include <stdexcept>
#include <string>

#include "wayfarer/log.hpp"

namespace wayfarer {

namespace {
constexpr int ComputeWindowBits(ZStreamRAII::Variant variant) {
  // 16 added to the window bits selects the gzip wrapper instead of the zlib one.
  return variant == ZStreamRAII::Variant::gzip ? MAX_WBITS + 16 : MAX_WBITS;
}
}  // namespace

ZStreamRAII::ZStreamRAII(Variant variant) : _isDeflate(false) {
  const auto ret = inflateInit2(&stream, ComputeWindowBits(variant));
  if (ret != Z_OK) {
    throw std::runtime_error("Error from inflateInit2 - error " + std::to_string(ret));
  }
}

ZStreamRAII::ZStreamRAII(Variant variant, int8_t level) : _isDeflate(true) {
  const auto ret = deflateInit2(&stream, level, Z_DEFLATED, ComputeWindowBits(variant), 8, Z_DEFAULT_STRATEGY);
  if (ret != Z_OK) {
    throw std::runtime_error("Error from deflateInit2 - error " + std::to_string(ret));
  }
}

ZStreamRAII::~ZStreamRAII() {
  const auto ret = _isDeflate ? deflateEnd(&stream) : inflateEnd(&stream);
  // Z_DATA_ERROR is returned by deflateEnd when the stream is freed before finishing, which happens
  // legitimately when a response is abandoned.
  if (ret != Z_OK && ret != Z_DATA_ERROR) {
    log::error("zlib: {}End returned {} (ignored)", _isDeflate ? "deflate" : "inflate", ret);
  }
}

}  // namespace wayfarer
