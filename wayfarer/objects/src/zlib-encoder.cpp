#include "wayfarer/zlib-encoder.hpp"

#include <zconf.h>
#include <zlib.h>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "wayfarer/zlib-stream-raii.hpp"

namespace wayfarer {

ZlibEncoderContext::ZlibEncoderContext(ZStreamRAII::Variant variant, int8_t level, std::size_t chunkSize)
    : _zs(variant, level), _chunkSize(chunkSize) {}

std::string_view ZlibEncoderContext::encodeChunk(std::string_view chunk) {
  _buf.clear();

  _zs.stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(chunk.data()));
  _zs.stream.avail_in = static_cast<uInt>(chunk.size());

  const auto flush = chunk.empty() ? Z_FINISH : Z_NO_FLUSH;
  do {
    const auto oldSize = _buf.size();
    _buf.resize(oldSize + _chunkSize);

    _zs.stream.next_out = reinterpret_cast<unsigned char*>(_buf.data() + oldSize);
    _zs.stream.avail_out = static_cast<uInt>(_chunkSize);

    const auto ret = deflate(&_zs.stream, flush);
    if (ret == Z_STREAM_ERROR) {
      throw std::runtime_error("Zlib streaming error " + std::to_string(ret));
    }

    _buf.resize(oldSize + _chunkSize - _zs.stream.avail_out);

    if (ret == Z_STREAM_END) {
      break;
    }
  } while (_zs.stream.avail_out == 0 || _zs.stream.avail_in > 0);

  return _buf;
}

void ZlibEncoder::encodeFull(std::string_view data, std::string& out) {
  ZStreamRAII zs(_variant, _level);

  auto& zstream = zs.stream;

  zstream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  zstream.avail_in = static_cast<uInt>(data.size());

  const auto maxCompressedSize = static_cast<std::size_t>(deflateBound(&zstream, static_cast<uLong>(data.size())));

  const auto oldSize = out.size();
  out.resize(oldSize + maxCompressedSize);

  zstream.next_out = reinterpret_cast<unsigned char*>(out.data() + oldSize);
  zstream.avail_out = static_cast<uInt>(maxCompressedSize);

  const auto rc = deflate(&zstream, Z_FINISH);
  if (rc != Z_STREAM_END) {
    out.resize(oldSize);
    throw std::runtime_error("Error " + std::to_string(rc) + " during " +
                             (_variant == ZStreamRAII::Variant::gzip ? "gzip" : "deflate") + " compression");
  }

  out.resize(oldSize + maxCompressedSize - zstream.avail_out);
}

}  // namespace wayfarer
