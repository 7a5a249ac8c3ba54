#pragma once

#include <ostream>
#include <string_view>

#include "wayfarer/response-sink.hpp"
#include "wayfarer/task.hpp"

// Sink used by the examples in place of a transport: the serialized response is printed.
class OstreamSink : public wayfarer::ResponseSink {
 public:
  explicit OstreamSink(std::ostream& os) : _os(os) {}

  wayfarer::WriteTask write(std::string_view data) override {
    _os << data;
    co_return;
  }

 private:
  std::ostream& _os;
};
