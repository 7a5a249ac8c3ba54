#pragma once

#include <brotli/encode.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include "wayfarer/compression-config.hpp"
#include "wayfarer/encoder.hpp"

namespace wayfarer {

class BrotliEncoderContext final : public EncoderContext {
 public:
  BrotliEncoderContext(int quality, std::size_t chunkSize);

  std::string_view encodeChunk(std::string_view chunk) override;

 private:
  std::unique_ptr<BrotliEncoderState, void (*)(BrotliEncoderState *)> _state;
  std::string _buf;
  std::size_t _chunkSize;
};

class BrotliEncoder final : public Encoder {
 public:
  explicit BrotliEncoder(const CompressionConfig &cfg)
      : _quality(cfg.brotliQuality.value_or(BROTLI_DEFAULT_QUALITY)), _chunkSize(cfg.chunkSize) {}

  void encodeFull(std::string_view data, std::string &out) override;

  std::unique_ptr<EncoderContext> makeContext() override {
    return std::make_unique<BrotliEncoderContext>(_quality, _chunkSize);
  }

 private:
  int _quality;
  std::size_t _chunkSize;
};

}  // namespace wayfarer
