#pragma once

#include <coroutine>
#include <cstddef>
#include <string>
#include <string_view>

#include "wayfarer/response-sink.hpp"
#include "wayfarer/task.hpp"

namespace wayfarer::test {

// Sink completing all writes synchronously, accumulating them in memory.
class StringSink : public ResponseSink {
 public:
  WriteTask write(std::string_view data) override;

  [[nodiscard]] const std::string& data() const noexcept { return _data; }

  [[nodiscard]] std::size_t nbWrites() const noexcept { return _nbWrites; }

  void clear() noexcept {
    _data.clear();
    _nbWrites = 0;
  }

 private:
  std::string _data;
  std::size_t _nbWrites{0};
};

// Sink suspending each write until completePendingWrite() is called, like a transport waiting for its socket.
class SuspendingSink : public ResponseSink {
 public:
  WriteTask write(std::string_view data) override;

  [[nodiscard]] bool hasPendingWrite() const noexcept { return static_cast<bool>(_pending); }

  // Resumes the suspended writer. No-op without pending write.
  void completePendingWrite();

  [[nodiscard]] const std::string& data() const noexcept { return _data; }

 private:
  struct WriteReady {
    [[nodiscard]] bool await_ready() const noexcept { return false; }
    void await_suspend(std::coroutine_handle<> handle) noexcept { sink->_pending = handle; }
    void await_resume() const noexcept {}

    SuspendingSink* sink;
  };

  std::string _data;
  std::coroutine_handle<> _pending;
};

}  // namespace wayfarer::test
