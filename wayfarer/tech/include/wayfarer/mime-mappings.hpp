#pragma once

#include <cstdint>
#include <string_view>

namespace wayfarer {

struct MIMEMapping {
  std::string_view extension;
  std::string_view mimeType;
  // Whether a textual payload of this type benefits from content coding.
  bool compressible;
};

using MIMETypeIdx = uint8_t;

inline constexpr MIMETypeIdx kUnknownMIMEMappingIdx = static_cast<MIMETypeIdx>(~0);

inline constexpr MIMEMapping kMIMEMappings[] = {
    {"7z", "application/x-7z-compressed", false},
    {"aac", "audio/aac", false},
    {"apng", "image/apng", false},
    {"avi", "video/x-msvideo", false},
    {"avif", "image/avif", false},
    {"bmp", "image/bmp", true},
    {"c", "text/x-csrc", true},
    {"cc", "text/x-c++src", true},
    {"cpp", "text/x-c++src", true},
    {"css", "text/css", true},
    {"csv", "text/csv", true},
    {"doc", "application/msword", false},
    {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document", false},
    {"exe", "application/vnd.microsoft.portable-executable", false},
    {"flac", "audio/flac", false},
    {"gif", "image/gif", false},
    {"gz", "application/gzip", false},
    {"h", "text/x-chdr", true},
    {"hpp", "text/x-c++hdr", true},
    {"htm", "text/html", true},
    {"html", "text/html", true},
    {"ico", "image/x-icon", true},
    {"jfif", "image/jpeg", false},
    {"jpeg", "image/jpeg", false},
    {"jpg", "image/jpeg", false},
    // Per IETF RFC 9239, `text/javascript` is the recommended media type for JavaScript source.
    {"js", "text/javascript", true},
    {"json", "application/json", true},
    {"m4a", "audio/mp4", false},
    {"m4v", "video/x-m4v", false},
    {"map", "application/json", true},
    {"md", "text/markdown", true},
    {"mjs", "text/javascript", true},
    {"mov", "video/quicktime", false},
    {"mp3", "audio/mpeg", false},
    {"mp4", "video/mp4", false},
    {"mpeg", "video/mpeg", false},
    {"mpg", "video/mpeg", false},
    {"oga", "audio/ogg", false},
    {"ogg", "audio/ogg", false},
    {"otf", "font/otf", true},
    {"pdf", "application/pdf", false},
    {"pjp", "image/jpeg", false},
    {"pjpeg", "image/jpeg", false},
    {"png", "image/png", false},
    {"ppt", "application/vnd.ms-powerpoint", false},
    {"pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation", false},
    {"py", "text/x-python", true},
    {"rar", "application/vnd.rar", false},
    {"rss", "application/rss+xml", true},
    {"sh", "application/x-sh", true},
    {"svg", "image/svg+xml", true},
    {"tar", "application/x-tar", true},
    {"tgz", "application/gzip", false},
    {"tif", "image/tiff", false},
    {"tiff", "image/tiff", false},
    {"ttf", "font/ttf", true},
    {"txt", "text/plain", true},
    {"wasm", "application/wasm", true},
    {"webm", "video/webm", false},
    {"webp", "image/webp", false},
    {"woff", "font/woff", false},
    {"woff2", "font/woff2", false},
    {"xhtml", "application/xhtml+xml", true},
    {"xls", "application/vnd.ms-excel", false},
    {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet", false},
    {"xml", "application/xml", true},
    {"zip", "application/zip", false},
};

// Looks up an extension (without the dot, a leading dot is tolerated) in kMIMEMappings.
// This function is non-allocating, and case insensitive.
// Returns kUnknownMIMEMappingIdx if the extension is not known.
[[nodiscard]] MIMETypeIdx FindMIMETypeIdxByExtension(std::string_view extension);

// Given a file path, determine the appropriate MIME type mapping index from its last extension, if known.
// Otherwise, returns kUnknownMIMEMappingIdx.
[[nodiscard]] MIMETypeIdx DetermineMIMETypeIdx(std::string_view path);

// Given a file path, determine the appropriate MIME type string, if known.
// Otherwise, returns an empty string_view.
[[nodiscard]] std::string_view DetermineMIMETypeStr(std::string_view path);

}  // namespace wayfarer
