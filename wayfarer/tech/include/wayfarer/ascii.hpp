#pragma once

// Locale independent ASCII helpers. Unlike <cctype>, they are constexpr and safe to call with any char value.

namespace wayfarer {

constexpr bool isdigit(char ch) { return ch >= '0' && ch <= '9'; }

constexpr bool isalpha(char ch) { return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z'); }

constexpr bool isspace(char ch) { return ch == ' ' || (ch >= '\t' && ch <= '\r'); }

constexpr bool isblank(char ch) { return ch == ' ' || ch == '\t'; }

constexpr char tolower(char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    return static_cast<char>(ch | 0x20);
  }
  return ch;
}

constexpr char toupper(char ch) {
  if (ch >= 'a' && ch <= 'z') {
    return static_cast<char>(ch & 0xDF);
  }
  return ch;
}

}  // namespace wayfarer
