#pragma once

#include <zstd.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include "wayfarer/compression-config.hpp"
#include "wayfarer/encoder.hpp"

namespace wayfarer {

namespace details {

struct ZstdContextRAII {
  explicit ZstdContextRAII(int level);

  std::unique_ptr<ZSTD_CCtx, void (*)(ZSTD_CCtx*)> ctx;
};

}  // namespace details

class ZstdEncoderContext : public EncoderContext {
 public:
  ZstdEncoderContext(int level, std::size_t chunkSize) : _zs(level), _chunkSize(chunkSize) {}

  std::string_view encodeChunk(std::string_view chunk) override;

 private:
  std::string _buf;
  details::ZstdContextRAII _zs;
  std::size_t _chunkSize;
};

class ZstdEncoder : public Encoder {
 public:
  explicit ZstdEncoder(const CompressionConfig& cfg)
      : _level(cfg.zstdLevel.value_or(ZSTD_CLEVEL_DEFAULT)), _zs(_level), _chunkSize(cfg.chunkSize) {}

  void encodeFull(std::string_view data, std::string& out) override;

  std::unique_ptr<EncoderContext> makeContext() override {
    return std::make_unique<ZstdEncoderContext>(_level, _chunkSize);
  }

 private:
  int _level;
  details::ZstdContextRAII _zs;
  std::size_t _chunkSize;
};

}  // namespace wayfarer
