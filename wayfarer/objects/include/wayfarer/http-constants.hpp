#pragma once

#include <string_view>

namespace wayfarer::http {

// NOTE ON CASE SENSITIVITY
// ------------------------
// HTTP header field names are case-insensitive per RFC 7230. We store them here
// in their conventional canonical form for emission. Lookups in HttpRequest and
// HttpResponse are case-insensitive.

// Version
inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

// Standard Header Field Names
inline constexpr std::string_view Accept = "Accept";
inline constexpr std::string_view AcceptEncoding = "Accept-Encoding";
inline constexpr std::string_view Authorization = "Authorization";
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view ContentEncoding = "Content-Encoding";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Cookie = "Cookie";
inline constexpr std::string_view Host = "Host";
inline constexpr std::string_view IfModifiedSince = "If-Modified-Since";
inline constexpr std::string_view LastModified = "Last-Modified";
inline constexpr std::string_view Location = "Location";
inline constexpr std::string_view Referer = "Referer";
inline constexpr std::string_view SetCookie = "Set-Cookie";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view UserAgent = "User-Agent";
inline constexpr std::string_view Vary = "Vary";
inline constexpr std::string_view WWWAuthenticate = "WWW-Authenticate";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";

// Compression
inline constexpr std::string_view identity = "identity";
inline constexpr std::string_view gzip = "gzip";
inline constexpr std::string_view deflate = "deflate";
inline constexpr std::string_view zstd = "zstd";  // RFC 8878
inline constexpr std::string_view br = "br";      // RFC 7932 (Brotli)

// Common Header Values (lowercase tokens where case-insensitive comparison used)
inline constexpr std::string_view close = "close";
inline constexpr std::string_view chunked = "chunked";

// Content type
inline constexpr std::string_view ContentTypeTextPlain = "text/plain; charset=utf-8";
inline constexpr std::string_view ContentTypeTextHtml = "text/html; charset=utf-8";
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";
inline constexpr std::string_view ContentTypeFormUrlEncoded = "application/x-www-form-urlencoded";

}  // namespace wayfarer::http
