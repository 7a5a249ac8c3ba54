#pragma once

#include <string_view>

#include "wayfarer/task.hpp"

namespace wayfarer {

// Byte sink of the transport, receiving a serialized response.
// Implementations may complete writes synchronously (the returned task finishes on its first resumption)
// or suspend until the bytes have been handed over to the peer.
class ResponseSink {
 public:
  virtual ~ResponseSink() = default;

  // 'data' stays valid until the returned task completes.
  // Failures are reported by throwing std::runtime_error from the task.
  virtual WriteTask write(std::string_view data) = 0;
};

}  // namespace wayfarer
