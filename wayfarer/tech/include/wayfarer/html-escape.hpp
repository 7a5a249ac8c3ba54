#pragma once

#include <string>
#include <string_view>

namespace wayfarer {

// Appends 'text' to 'out', escaping the characters having a meaning in HTML text and attribute values.
void AppendHtmlEscaped(std::string_view text, std::string& out);

}  // namespace wayfarer
