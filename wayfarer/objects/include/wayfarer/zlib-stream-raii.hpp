#pragma once

#include <zlib.h>

#include <cstdint>

namespace wayfarer {

struct ZStreamRAII {
  enum class Variant : int8_t { gzip, deflate };

  // Initialize a z_stream for decompression.
  // Throws std::runtime_error on failure.
  explicit ZStreamRAII(Variant variant);

  // Initialize a z_stream for compression.
  // Throws std::runtime_error on failure.
  ZStreamRAII(Variant variant, int8_t level);

  // z_stream is self-referencing once initialized, it cannot be moved or copied.
  ZStreamRAII(const ZStreamRAII &) = delete;
  ZStreamRAII(ZStreamRAII &&) noexcept = delete;
  ZStreamRAII &operator=(const ZStreamRAII &) = delete;
  ZStreamRAII &operator=(ZStreamRAII &&) noexcept = delete;

  ~ZStreamRAII();

  z_stream stream{};

 private:
  bool _isDeflate;
};

}  // namespace wayfarer
