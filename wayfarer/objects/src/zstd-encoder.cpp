#include "wayfarer/zstd-encoder.hpp"

#include <cstddef>
#include <new>
#include <stdexcept>
#include <string>
#include <string_view>

namespace wayfarer {

namespace details {

namespace {
void ZSTD_freeWrapper(ZSTD_CCtx* pCtx) { (void)ZSTD_freeCCtx(pCtx); }

void CheckParameter(std::size_t ret, const char* what) {
  if (ZSTD_isError(ret) != 0U) [[unlikely]] {
    throw std::invalid_argument(std::string("Invalid zstd ") + what + ": " + ZSTD_getErrorName(ret));
  }
}
}  // namespace

ZstdContextRAII::ZstdContextRAII(int level) : ctx(ZSTD_createCCtx(), &ZSTD_freeWrapper) {
  if (!ctx) [[unlikely]] {
    throw std::bad_alloc();
  }

  CheckParameter(ZSTD_CCtx_setParameter(ctx.get(), ZSTD_c_compressionLevel, level), "compression level");
}
}  // namespace details

std::string_view ZstdEncoderContext::encodeChunk(std::string_view chunk) {
  ZSTD_inBuffer inBuf{chunk.data(), chunk.size(), 0};
  const auto mode = chunk.empty() ? ZSTD_e_end : ZSTD_e_continue;

  for (_buf.clear();;) {
    const auto oldSize = _buf.size();
    _buf.resize(oldSize + _chunkSize);

    // ZSTD_outBuffer.pos is relative to dst, so always 0 here.
    ZSTD_outBuffer outBuf{_buf.data() + oldSize, _chunkSize, 0};

    const std::size_t ret = ZSTD_compressStream2(_zs.ctx.get(), &outBuf, &inBuf, mode);
    if (ZSTD_isError(ret) != 0U) [[unlikely]] {
      throw std::runtime_error(std::string("ZSTD_compressStream2 error: ") + ZSTD_getErrorName(ret));
    }

    _buf.resize(oldSize + outBuf.pos);
    if (chunk.empty()) {
      if (ret == 0) [[likely]] {
        break;
      }
    } else if (inBuf.pos == inBuf.size) {
      break;
    }
  }
  return _buf;
}

void ZstdEncoder::encodeFull(std::string_view data, std::string& out) {
  const auto oldSize = out.size();
  const auto maxCompressedSize = ZSTD_compressBound(data.size());

  out.resize(oldSize + maxCompressedSize);

  const auto written = ZSTD_compress2(_zs.ctx.get(), out.data() + oldSize, maxCompressedSize, data.data(), data.size());
  if (ZSTD_isError(written) != 0U) [[unlikely]] {
    out.resize(oldSize);
    throw std::runtime_error(std::string("zstd compress2 error: ") + ZSTD_getErrorName(written));
  }

  out.resize(oldSize + written);
}

}  // namespace wayfarer
