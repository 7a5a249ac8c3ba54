#include "wayfarer/files.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "wayfarer/accept-encoding-negotiation.hpp"
#include "wayfarer/encoder.hpp"
#include "wayfarer/encoding.hpp"
#include "wayfarer/file.hpp"
#include "wayfarer/html-escape.hpp"
#include "wayfarer/http-constants.hpp"
#include "wayfarer/http-context.hpp"
#include "wayfarer/http-status.hpp"
#include "wayfarer/log.hpp"
#include "wayfarer/response-sink.hpp"
#include "wayfarer/route-result.hpp"
#include "wayfarer/runtime-config.hpp"
#include "wayfarer/task.hpp"
#include "wayfarer/timestring.hpp"
#include "wayfarer/url-encode.hpp"

namespace wayfarer::files {

namespace {

using SharedFile = std::shared_ptr<const ::wayfarer::File>;

// Component-wise check that 'candidate' is 'root' or lies under it.
bool IsWithin(const std::filesystem::path& root, const std::filesystem::path& candidate) {
  auto candidateIt = candidate.begin();
  for (const auto& rootPart : root) {
    if (rootPart.empty()) {
      // trailing separator of the root
      continue;
    }
    if (candidateIt == candidate.end() || *candidateIt != rootPart) {
      return false;
    }
    ++candidateIt;
  }
  return true;
}

WriteTask StreamFile(SharedFile file, std::size_t chunkSize, ResponseSink& sink) {
  std::string buf(std::min(chunkSize, std::max<std::size_t>(file->size(), 1U)), '\0');
  for (std::size_t offset = 0; offset < file->size();) {
    const std::size_t nbRead = file->readAt(std::as_writable_bytes(std::span<char>(buf)), offset);
    if (nbRead == ::wayfarer::File::kError) {
      throw std::runtime_error("Unable to read file content at offset " + std::to_string(offset));
    }
    if (nbRead == 0) {
      // the announced Content-Length cannot be honored anymore
      throw std::runtime_error("File shrank while being sent, " + std::to_string(offset) + " bytes out of " +
                               std::to_string(file->size()));
    }
    const std::size_t nbToSend = std::min(nbRead, file->size() - offset);
    co_await sink.write(std::string_view(buf.data(), nbToSend));
    offset += nbToSend;
  }
}

WriteTask StreamCompressedFile(SharedFile file, Encoding encoding, std::shared_ptr<const RuntimeConfig> runtime,
                               ResponseSink& sink) {
  const std::unique_ptr<Encoder> encoder = MakeEncoder(encoding, runtime->compression);
  if (!encoder) {
    throw std::runtime_error(std::string("Encoder ") + std::string(GetEncodingStr(encoding)) + " is not available");
  }
  const std::unique_ptr<EncoderContext> encoderContext = encoder->makeContext();

  std::string buf(runtime->fileChunkSize, '\0');
  for (std::size_t offset = 0;;) {
    const std::size_t nbRead = file->readAt(std::as_writable_bytes(std::span<char>(buf)), offset);
    if (nbRead == ::wayfarer::File::kError) {
      throw std::runtime_error("Unable to read file content at offset " + std::to_string(offset));
    }
    if (nbRead == 0) {
      break;
    }
    offset += nbRead;
    const std::string_view encoded = encoderContext->encodeChunk(std::string_view(buf.data(), nbRead));
    if (!encoded.empty()) {
      co_await sink.write(encoded);
    }
  }
  const std::string_view tail = encoderContext->encodeChunk({});
  if (!tail.empty()) {
    co_await sink.write(tail);
  }
}

RouteResult<HttpContext> SendFileTo(const HttpContext& ctx, const std::filesystem::path& path, bool allowCompression) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return kNoMatch;
  }
  auto file = std::make_shared<const ::wayfarer::File>(path);
  if (!*file) {
    return kNoMatch;
  }

  const RuntimeConfig& config = ctx.config();
  HttpContext out = ctx;
  HttpResponse& response = out.response;

  const std::optional<MimeDescriptor> mimeType = config.mimeTypeOf(path.filename().string());
  if (mimeType) {
    response.header(http::ContentType, mimeType->name);
  } else if (!config.defaultContentType.empty()) {
    response.header(http::ContentType, config.defaultContentType);
  }
  response.header(http::LastModified, TimeToStringRFC7231(file->lastModified()));

  if (const auto ifModifiedSince = ctx.request.headerValue(http::IfModifiedSince)) {
    const SysTimePoint since = TryParseTimeRFC7231(*ifModifiedSince);
    if (since != kInvalidTimePoint &&
        std::chrono::floor<std::chrono::seconds>(file->lastModified()) <= since) {
      log::debug("'{}' not modified since {}", path.string(), *ifModifiedSince);
      response.status(http::Status::NotModified).clearBody().removeHeader(http::ContentLength);
      return out;
    }
  }

  response.status(http::Status::OK);

  const CompressionConfig& compression = config.compression;
  if (allowCompression && mimeType && mimeType->compressible && compression.isEligible(mimeType->name, file->size())) {
    const EncodingSelector selector(compression);
    const auto negotiated = selector.negotiateAcceptEncoding(ctx.request.headerValueOrEmpty(http::AcceptEncoding));
    if (negotiated.reject) {
      response.removeHeader(http::ContentType).removeHeader(http::LastModified);
      response.status(http::Status::NotAcceptable).header(http::ContentLength, "0").clearBody();
      return out;
    }
    if (negotiated.encoding != Encoding::none) {
      log::debug("Sending '{}' with {} encoding", path.string(), GetEncodingStr(negotiated.encoding));
      if (compression.addVaryHeader) {
        response.addHeader(http::Vary, http::AcceptEncoding);
      }
      response.header(http::ContentEncoding, GetEncodingStr(negotiated.encoding)).removeHeader(http::ContentLength);
      response.body([file, encoding = negotiated.encoding](const HttpContext& writeCtx, ResponseSink& sink) {
        return StreamCompressedFile(file, encoding, writeCtx.runtime, sink);
      });
      return out;
    }
  }

  response.header(http::ContentLength, std::to_string(file->size()));
  response.body([file, chunkSize = config.fileChunkSize](const HttpContext&, ResponseSink& sink) {
    return StreamFile(file, chunkSize, sink);
  });
  return out;
}

struct DirectoryListingEntry {
  std::string name;
  bool isDirectory{false};
  bool sizeKnown{false};
  std::uintmax_t sizeBytes{0};
  SysTimePoint lastModified{kInvalidTimePoint};
};

struct DirectoryListingResult {
  std::vector<DirectoryListingEntry> entries;
  bool truncated{false};
  bool isValid{false};
};

DirectoryListingResult CollectDirectoryListing(const std::filesystem::path& directory, const RuntimeConfig& config) {
  DirectoryListingResult result;
  const std::size_t limit =
      config.maxEntriesToList == 0U ? std::numeric_limits<std::size_t>::max() : config.maxEntriesToList;

  std::error_code ec;
  std::filesystem::directory_iterator iter(directory, ec);
  if (ec) {
    log::error("Failed to open directory for listing '{}': {}", directory.string(), ec.message());
    return result;
  }

  const std::filesystem::directory_iterator end;
  while (!ec && iter != end) {
    const std::filesystem::directory_entry current = *iter;
    iter.increment(ec);
    if (ec) {
      log::warn("Failed to advance directory iterator for '{}': {}", directory.string(), ec.message());
    }
    const bool hasMore = !ec && iter != end;

    std::string name = current.path().filename().string();
    if (!config.showHiddenFiles && name.starts_with('.')) {
      continue;
    }

    DirectoryListingEntry& info = result.entries.emplace_back();
    info.name = std::move(name);

    std::error_code stepEc;
    if (current.is_directory(stepEc)) {
      info.isDirectory = true;
    } else if (!stepEc) {
      const auto fileSize = current.file_size(stepEc);
      if (stepEc) {
        log::warn("Failed to get size of directory entry '{}': {}", current.path().string(), stepEc.message());
      } else {
        info.sizeKnown = true;
        info.sizeBytes = fileSize;
      }
    }

    const auto writeTime = current.last_write_time(stepEc);
    if (!stepEc) {
      info.lastModified = std::chrono::time_point_cast<SysDuration>(std::chrono::file_clock::to_sys(writeTime));
    }

    if (result.entries.size() >= limit) {
      result.truncated = hasMore;
      break;
    }
  }

  if (ec) {
    return result;
  }
  result.isValid = true;

  std::ranges::sort(result.entries, [](const DirectoryListingEntry& lhs, const DirectoryListingEntry& rhs) {
    // Directories first
    if (lhs.isDirectory != rhs.isDirectory) {
      return lhs.isDirectory;
    }
    return lhs.name < rhs.name;
  });
  return result;
}

// Human readable size in binary units: "512 B", "1.5 KB", "11 MB".
// One decimal is printed when the value in the chosen unit is below 10.
void AppendFormattedSize(std::uintmax_t size, std::string& out) {
  static constexpr std::array<std::string_view, 5> kUnits{"B", "KB", "MB", "GB", "TB"};

  std::size_t unitIdx = 0;
  std::uintmax_t divisor = 1;
  for (; unitIdx + 1U < kUnits.size() && size >= divisor * 1024U; ++unitIdx) {
    divisor *= 1024U;
  }

  if (unitIdx != 0U && size < divisor * 10U) {
    std::uintmax_t intPart = size / divisor;
    std::uintmax_t frac10 = ((size % divisor) * 10U + divisor / 2U) / divisor;
    if (frac10 >= 10U) {
      // carry, 9.96 rounds to 10
      ++intPart;
      frac10 = 0U;
    }
    if (intPart < 10U) {
      out.append(std::to_string(intPart));
      out.push_back('.');
      out.append(std::to_string(frac10));
      out.push_back(' ');
      out.append(kUnits[unitIdx]);
      return;
    }
  }

  out.append(std::to_string((size + divisor / 2U) / divisor));
  out.push_back(' ');
  out.append(kUnits[unitIdx]);
}

void AppendDirectoryListingCss(std::string_view customCss, std::string& out) {
  if (!customCss.empty()) {
    out.append(customCss);
    return;
  }
  out.append(R"CSS(
body{font-family:system-ui,-apple-system,BlinkMacSystemFont,"Segoe UI",sans-serif;margin:2rem;}
table{border-collapse:collapse;width:100%;max-width:960px;}
th,td{padding:0.3rem 0.6rem;text-align:left;border-bottom:1px solid #e0e0e0;}
tbody tr:hover{background:#f8f8f8;}
td.size,td.modified{text-align:right;font-variant-numeric:tabular-nums;}
h1{font-size:1.4rem;margin-bottom:1rem;}
#truncated{margin-top:1rem;color:#b24e00;}
footer{margin-top:2rem;font-size:0.85rem;color:#666;}
a.dir::after{content:"/";}
)CSS");
}

std::string RenderDirectoryListing(std::string_view requestPath, const DirectoryListingResult& listing,
                                   std::string_view customCss) {
  // links are absolute, so that they do not depend on a trailing slash in the request path
  std::string basePath;
  url::AppendEncoded(requestPath, [](char ch) { return ch == '/' || url::IsUnreserved(ch); }, basePath);
  if (!basePath.ends_with('/')) {
    basePath.push_back('/');
  }

  std::string body;
  body.reserve(2048U);
  body.append("<!doctype html>\n<html lang=\"en\">\n<head>\n<meta charset=\"utf-8\">\n<title>Index of ");
  AppendHtmlEscaped(requestPath, body);
  body.append("</title>\n<style>");
  AppendDirectoryListingCss(customCss, body);
  body.append("</style>\n</head>\n<body>\n<h1>Index of ");
  AppendHtmlEscaped(requestPath, body);
  body.append(
      "</h1>\n<table>\n<thead><tr><th>Name</th><th class=\"size\">Size</th><th class=\"modified\">Last "
      "Modified</th></tr></thead>\n<tbody>\n");

  if (requestPath != "/") {
    body.append("<tr><td class=\"name\"><a href=\"");
    AppendHtmlEscaped(basePath, body);
    body.append(
        "../\" class=\"dir\">..</a></td><td class=\"size\">-</td><td "
        "class=\"modified\">-</td></tr>\n");
  }

  for (const auto& entry : listing.entries) {
    std::string href = basePath;
    url::AppendEncoded(entry.name, url::IsUnreserved, href);
    if (entry.isDirectory) {
      href.push_back('/');
    }

    body.append(R"(<tr><td class="name"><a href=")");
    AppendHtmlEscaped(href, body);
    body.push_back('"');
    if (entry.isDirectory) {
      body.append(" class=\"dir\"");
    }
    body.push_back('>');
    AppendHtmlEscaped(entry.name, body);
    body.append("</a></td><td class=\"size\">");
    if (entry.sizeKnown && !entry.isDirectory) {
      AppendFormattedSize(entry.sizeBytes, body);
    } else {
      body.push_back('-');
    }
    body.append("</td><td class=\"modified\">");
    if (entry.lastModified == kInvalidTimePoint) {
      body.push_back('-');
    } else {
      body.append(TimeToStringRFC7231(entry.lastModified));
    }
    body.append("</td></tr>\n");
  }

  body.append("</tbody>\n</table>\n");
  if (listing.truncated) {
    body.append("<p id=\"truncated\">Listing truncated after ");
    body.append(std::to_string(listing.entries.size()));
    body.append(" entries.</p>\n");
  }
  body.append("<footer>Served by wayfarer</footer>\n</body>\n</html>\n");
  return body;
}

// Index file of 'directory', resolved like any other target: std::nullopt when there is none, or when it
// resolves outside of 'rootDir' (a symbolic link pointing elsewhere).
std::optional<std::filesystem::path> IndexFileOf(const std::filesystem::path& directory,
                                                 const std::filesystem::path& rootDir, const RuntimeConfig& config) {
  if (config.defaultIndex.empty()) {
    return std::nullopt;
  }
  std::error_code ec;
  const std::filesystem::path root = std::filesystem::weakly_canonical(rootDir, ec);
  if (ec) {
    return std::nullopt;
  }
  std::filesystem::path index = std::filesystem::weakly_canonical(directory / config.defaultIndex, ec);
  if (ec) {
    return std::nullopt;
  }
  if (!IsWithin(root, index)) {
    log::warn("Index file of '{}' resolves outside of root directory '{}'", directory.string(), root.string());
    return std::nullopt;
  }
  if (!std::filesystem::is_regular_file(index, ec)) {
    return std::nullopt;
  }
  return index;
}

RouteResult<HttpContext> ListDirectory(const HttpContext& ctx, const std::filesystem::path& rootDir) {
  const RuntimeConfig& config = ctx.config();
  const auto directory = LocalFile(ctx.request.path(), rootDir);
  std::error_code ec;
  if (!directory || !std::filesystem::is_directory(*directory, ec) || IndexFileOf(*directory, rootDir, config)) {
    return kNoMatch;
  }

  const DirectoryListingResult listing = CollectDirectoryListing(*directory, config);
  if (!listing.isValid) {
    return kNoMatch;
  }

  HttpContext out = ctx;
  std::string body = RenderDirectoryListing(ctx.request.path(), listing, config.directoryListingCss);
  out.response.status(http::Status::OK)
      .header(http::ContentType, http::ContentTypeTextHtml)
      .header(http::ContentLength, std::to_string(body.size()))
      .body(std::move(body));
  return out;
}

}  // namespace

std::optional<std::filesystem::path> LocalFile(std::string_view name, const std::filesystem::path& rootDir) {
  while (name.starts_with('/')) {
    name.remove_prefix(1);
  }

  std::error_code ec;
  const std::filesystem::path root = std::filesystem::weakly_canonical(rootDir, ec);
  if (ec) {
    log::warn("Unable to canonicalize root directory '{}': {}", rootDir.string(), ec.message());
    return std::nullopt;
  }
  std::filesystem::path candidate = std::filesystem::weakly_canonical(root / std::filesystem::path(name), ec);
  if (ec) {
    log::debug("Unable to canonicalize '{}' under '{}': {}", name, root.string(), ec.message());
    return std::nullopt;
  }
  if (!IsWithin(root, candidate)) {
    log::warn("Path '{}' resolves outside of root directory '{}'", name, root.string());
    return std::nullopt;
  }
  return candidate;
}

std::optional<std::filesystem::path> ResolvePath(const std::filesystem::path& rootDir, std::string_view name) {
  return LocalFile(name, rootDir);
}

Handler SendFile(std::filesystem::path path, bool allowCompression) {
  return [path = std::move(path), allowCompression](const HttpContext& ctx) {
    return SendFileTo(ctx, path, allowCompression);
  };
}

Handler File(std::string_view name) {
  return [name = std::string(name)](const HttpContext& ctx) -> RouteResult<HttpContext> {
    const RuntimeConfig& config = ctx.config();
    const auto path = LocalFile(name, config.homeDirectory);
    if (!path) {
      return kNoMatch;
    }
    return SendFileTo(ctx, *path, config.compressionEnabled);
  };
}

Handler BrowseFile(std::filesystem::path rootDir, std::string_view name) {
  return [rootDir = std::move(rootDir), name = std::string(name)](const HttpContext& ctx) -> RouteResult<HttpContext> {
    const auto path = LocalFile(name, rootDir);
    if (!path) {
      return kNoMatch;
    }
    return SendFileTo(ctx, *path, ctx.config().compressionEnabled);
  };
}

Handler BrowseFileHome(std::string_view name) { return File(name); }

Handler Browse(std::filesystem::path rootDir) {
  return [rootDir = std::move(rootDir)](const HttpContext& ctx) -> RouteResult<HttpContext> {
    const RuntimeConfig& config = ctx.config();
    const auto path = LocalFile(ctx.request.path(), rootDir);
    if (!path) {
      return kNoMatch;
    }
    std::error_code ec;
    if (std::filesystem::is_directory(*path, ec)) {
      const auto index = IndexFileOf(*path, rootDir, config);
      if (!index) {
        return kNoMatch;
      }
      return SendFileTo(ctx, *index, config.compressionEnabled);
    }
    return SendFileTo(ctx, *path, config.compressionEnabled);
  };
}

Handler BrowseHome() {
  return [](const HttpContext& ctx) { return Browse(ctx.config().homeDirectory)(ctx); };
}

Handler Dir(std::filesystem::path rootDir) {
  return [rootDir = std::move(rootDir)](const HttpContext& ctx) { return ListDirectory(ctx, rootDir); };
}

Handler DirHome() {
  return [](const HttpContext& ctx) { return ListDirectory(ctx, ctx.config().homeDirectory); };
}

}  // namespace wayfarer::files
