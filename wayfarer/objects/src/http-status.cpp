#include "wayfarer/http-status.hpp"

#include <algorithm>
#include <iterator>
#include <optional>

namespace wayfarer::http {

static_assert(std::ranges::is_sorted(kAllStatuses, {}, [](const StatusEntry &entry) { return entry.status; }),
              "kAllStatuses must be sorted by status code");

namespace {

const StatusEntry *FindEntry(int code) noexcept {
  const auto it = std::ranges::lower_bound(kAllStatuses, code, {},
                                           [](const StatusEntry &entry) { return StatusCode(entry.status); });
  if (it == std::end(kAllStatuses) || StatusCode(it->status) != code) {
    return nullptr;
  }
  return &*it;
}

}  // namespace

const StatusEntry &StatusEntryOf(Status status) noexcept {
  // Every enumerator has an entry in kAllStatuses.
  return *FindEntry(StatusCode(status));
}

std::optional<Status> TryParseStatus(int code) noexcept {
  const StatusEntry *entry = FindEntry(code);
  if (entry == nullptr) {
    return std::nullopt;
  }
  return entry->status;
}

}  // namespace wayfarer::http
