#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "wayfarer/encoding.hpp"

// Encoding abstraction, split into two interfaces:
//   * Encoder: configuration-only object providing one-shot compression and creating streaming contexts.
//   * EncoderContext: stateful streaming object created from an Encoder via makeContext().
// Lifecycle of a context: encodeChunk(data)* -> encodeChunk({}) (finish) -> destroy.
//
// Neither is thread-safe. A context is confined to a single response.
// Implementations throw std::runtime_error on fatal codec errors.

namespace wayfarer {

struct CompressionConfig;

class EncoderContext {
 public:
  virtual ~EncoderContext() = default;

  // Streaming chunk encoder. If 'data' is empty, it will be considered as a finish.
  // The returned view is valid until the next call on this context.
  virtual std::string_view encodeChunk(std::string_view data) = 0;
};

class Encoder {
 public:
  virtual ~Encoder() = default;

  // One-shot full-buffer compression, appending compressed data to 'out'.
  virtual void encodeFull(std::string_view data, std::string &out) = 0;

  // Create a streaming context. Each context is independent.
  virtual std::unique_ptr<EncoderContext> makeContext() = 0;
};

// Creates the encoder of given encoding, or nullptr for Encoding::none and encodings not compiled in.
std::unique_ptr<Encoder> MakeEncoder(Encoding encoding, const CompressionConfig &config);

}  // namespace wayfarer
