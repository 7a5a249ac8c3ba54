#include "wayfarer/string-sink.hpp"

#include <coroutine>
#include <string_view>
#include <utility>

#include "wayfarer/task.hpp"

namespace wayfarer::test {

WriteTask StringSink::write(std::string_view data) {
  _data.append(data);
  ++_nbWrites;
  co_return;
}

WriteTask SuspendingSink::write(std::string_view data) {
  co_await WriteReady{this};
  _data.append(data);
}

void SuspendingSink::completePendingWrite() {
  std::coroutine_handle<> pending = std::exchange(_pending, {});
  if (pending) {
    pending.resume();
  }
}

}  // namespace wayfarer::test
