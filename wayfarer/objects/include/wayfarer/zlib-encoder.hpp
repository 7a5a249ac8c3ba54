#pragma once

#include <zlib.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "wayfarer/compression-config.hpp"
#include "wayfarer/encoder.hpp"
#include "wayfarer/zlib-stream-raii.hpp"

namespace wayfarer {

class ZlibEncoderContext : public EncoderContext {
 public:
  ZlibEncoderContext(ZStreamRAII::Variant variant, int8_t level, std::size_t chunkSize);

  std::string_view encodeChunk(std::string_view chunk) override;

 private:
  std::string _buf;
  ZStreamRAII _zs;
  std::size_t _chunkSize;
};

class ZlibEncoder : public Encoder {
 public:
  ZlibEncoder(ZStreamRAII::Variant variant, const CompressionConfig& cfg)
      : _level(static_cast<int8_t>(cfg.gzipLevel.value_or(Z_DEFAULT_COMPRESSION))),
        _variant(variant),
        _chunkSize(cfg.chunkSize) {}

  void encodeFull(std::string_view data, std::string& out) override;

  std::unique_ptr<EncoderContext> makeContext() override {
    return std::make_unique<ZlibEncoderContext>(_variant, _level, _chunkSize);
  }

 private:
  int8_t _level;
  ZStreamRAII::Variant _variant;
  std::size_t _chunkSize;
};

}  // namespace wayfarer
