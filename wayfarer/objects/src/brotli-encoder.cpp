#include "wayfarer/brotli-encoder.hpp"

#include <brotli/encode.h>
#include <brotli/types.h>

#include <cstddef>
#include <cstdint>
#include <new>
#include <stdexcept>
#include <string>
#include <string_view>

namespace wayfarer {

BrotliEncoderContext::BrotliEncoderContext(int quality, std::size_t chunkSize)
    : _state(BrotliEncoderCreateInstance(nullptr, nullptr, nullptr), &BrotliEncoderDestroyInstance),
      _chunkSize(chunkSize) {
  if (!_state) {
    throw std::bad_alloc();
  }
  if (BrotliEncoderSetParameter(_state.get(), BROTLI_PARAM_QUALITY, static_cast<uint32_t>(quality)) == BROTLI_FALSE) {
    throw std::invalid_argument("Brotli set quality failed");
  }
}

std::string_view BrotliEncoderContext::encodeChunk(std::string_view chunk) {
  const uint8_t *nextIn = reinterpret_cast<const uint8_t *>(chunk.data());
  const BrotliEncoderOperation op = chunk.empty() ? BROTLI_OPERATION_FINISH : BROTLI_OPERATION_PROCESS;
  std::size_t availIn = chunk.size();

  //  - processing: loop until all provided bytes are consumed, without finishing the stream.
  //  - finishing: loop until the encoder reports the stream finished.
  for (_buf.clear();;) {
    const auto oldSize = _buf.size();
    _buf.resize(oldSize + _chunkSize);

    uint8_t *nextOut = reinterpret_cast<uint8_t *>(_buf.data() + oldSize);
    std::size_t availOut = _chunkSize;

    if (BrotliEncoderCompressStream(_state.get(), op, &availIn, &nextIn, &availOut, &nextOut, nullptr) ==
        BROTLI_FALSE) {
      throw std::runtime_error("BrotliEncoderCompressStream failed");
    }
    _buf.resize(oldSize + _chunkSize - availOut);

    if (chunk.empty()) {
      if (BrotliEncoderIsFinished(_state.get()) == BROTLI_TRUE) {
        break;
      }
    } else if (availIn == 0 && BrotliEncoderHasMoreOutput(_state.get()) == BROTLI_FALSE) {
      break;
    }
  }
  return _buf;
}

void BrotliEncoder::encodeFull(std::string_view data, std::string &out) {
  const auto oldSize = out.size();
  const std::size_t maxCompressedSize = BrotliEncoderMaxCompressedSize(data.size());

  out.resize(oldSize + maxCompressedSize);

  auto *dst = reinterpret_cast<uint8_t *>(out.data() + oldSize);
  std::size_t outSize = maxCompressedSize;

  if (BrotliEncoderCompress(_quality, BROTLI_DEFAULT_WINDOW, BROTLI_MODE_GENERIC, data.size(),
                            reinterpret_cast<const uint8_t *>(data.data()), &outSize, dst) == BROTLI_FALSE) {
    out.resize(oldSize);
    throw std::runtime_error("BrotliEncoderCompress failed");
  }

  out.resize(oldSize + outSize);
}

}  // namespace wayfarer
