#include "wayfarer/encoder.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "wayfarer/compression-config.hpp"
#include "wayfarer/encoding.hpp"
#include "wayfarer/features.hpp"

#ifdef WAYFARER_ENABLE_ZLIB
#include <zlib.h>

#include "wayfarer/zlib-stream-raii.hpp"
#endif
#ifdef WAYFARER_ENABLE_BROTLI
#include <brotli/decode.h>
#endif
#ifdef WAYFARER_ENABLE_ZSTD
#include <zstd.h>
#endif

namespace wayfarer {

namespace {

std::string MakePayload() {
  std::string payload;
  for (int line = 0; line < 2000; ++line) {
    payload.append("<li>entry number ");
    payload.append(std::to_string(line));
    payload.append(" of a fairly repetitive listing</li>\n");
  }
  return payload;
}

std::string Decompress(Encoding encoding, std::string_view data) {
  std::string out;
  switch (encoding) {
#ifdef WAYFARER_ENABLE_ZLIB
    case Encoding::gzip:
      [[fallthrough]];
    case Encoding::deflate: {
      ZStreamRAII zs(encoding == Encoding::gzip ? ZStreamRAII::Variant::gzip : ZStreamRAII::Variant::deflate);
      zs.stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
      zs.stream.avail_in = static_cast<uInt>(data.size());
      int ret = Z_OK;
      while (ret != Z_STREAM_END) {
        char buf[4096];
        zs.stream.next_out = reinterpret_cast<Bytef *>(buf);
        zs.stream.avail_out = sizeof(buf);
        ret = inflate(&zs.stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
          ADD_FAILURE() << "inflate error " << ret;
          break;
        }
        out.append(buf, sizeof(buf) - zs.stream.avail_out);
      }
      break;
    }
#endif
#ifdef WAYFARER_ENABLE_BROTLI
    case Encoding::br: {
      std::size_t decodedSize = 1 << 22;
      out.resize(decodedSize);
      if (BrotliDecoderDecompress(data.size(), reinterpret_cast<const uint8_t *>(data.data()), &decodedSize,
                                  reinterpret_cast<uint8_t *>(out.data())) != BROTLI_DECODER_RESULT_SUCCESS) {
        ADD_FAILURE() << "brotli decompression failed";
      }
      out.resize(decodedSize);
      break;
    }
#endif
#ifdef WAYFARER_ENABLE_ZSTD
    case Encoding::zstd: {
      out.resize(1 << 22);
      const auto written = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
      if (ZSTD_isError(written) != 0U) {
        ADD_FAILURE() << ZSTD_getErrorName(written);
        out.clear();
      } else {
        out.resize(written);
      }
      break;
    }
#endif
    default:
      ADD_FAILURE() << "unexpected encoding";
      break;
  }
  return out;
}

class EncoderTest : public ::testing::TestWithParam<Encoding> {
 protected:
  void SetUp() override {
    if (!IsEncodingEnabled(GetParam())) {
      GTEST_SKIP() << GetEncodingStr(GetParam()) << " not compiled in";
    }
    cfg.chunkSize = 512;
    encoder = MakeEncoder(GetParam(), cfg);
    ASSERT_NE(encoder, nullptr);
  }

  CompressionConfig cfg;
  std::unique_ptr<Encoder> encoder;
};

}  // namespace

TEST_P(EncoderTest, FullEncodeDecodes) {
  const std::string payload = MakePayload();
  std::string out("prefix");
  encoder->encodeFull(payload, out);
  ASSERT_TRUE(out.starts_with("prefix"));
  const std::string_view compressed = std::string_view(out).substr(6);
  EXPECT_LT(compressed.size(), payload.size());
  EXPECT_EQ(Decompress(GetParam(), compressed), payload);
}

TEST_P(EncoderTest, StreamingEncodeDecodes) {
  const std::string payload = MakePayload();
  auto ctx = encoder->makeContext();
  std::string compressed;
  for (std::size_t pos = 0; pos < payload.size(); pos += 1000) {
    compressed.append(ctx->encodeChunk(std::string_view(payload).substr(pos, 1000)));
  }
  compressed.append(ctx->encodeChunk({}));
  EXPECT_EQ(Decompress(GetParam(), compressed), payload);
}

TEST_P(EncoderTest, StreamingEmptyPayload) {
  auto ctx = encoder->makeContext();
  const std::string compressed(ctx->encodeChunk({}));
  EXPECT_FALSE(compressed.empty());
  EXPECT_EQ(Decompress(GetParam(), compressed), "");
}

INSTANTIATE_TEST_SUITE_P(AllEncodings, EncoderTest,
                         ::testing::Values(Encoding::gzip, Encoding::deflate, Encoding::br, Encoding::zstd),
                         [](const ::testing::TestParamInfo<Encoding> &info) {
                           return std::string(GetEncodingStr(info.param));
                         });

TEST(MakeEncoderTest, NoneHasNoEncoder) { EXPECT_EQ(MakeEncoder(Encoding::none, CompressionConfig{}), nullptr); }

}  // namespace wayfarer
