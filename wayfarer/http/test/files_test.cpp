#include "wayfarer/files.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "wayfarer/combinators.hpp"
#include "wayfarer/http-context.hpp"
#include "wayfarer/mime-types.hpp"
#include "wayfarer/response-builders.hpp"
#include "wayfarer/runtime-config.hpp"
#include "wayfarer/temp-file.hpp"
#include "wayfarer/test-util.hpp"
#include "wayfarer/timestring.hpp"

#ifdef WAYFARER_ENABLE_ZLIB
#include "wayfarer/zlib-stream-raii.hpp"
#endif

namespace wayfarer {

namespace {

std::string LargeHtml() {
  std::string html("<html><body>");
  for (int lineIdx = 0; lineIdx < 200; ++lineIdx) {
    html.append("<p>line number ").append(std::to_string(lineIdx)).append("</p>\n");
  }
  html.append("</body></html>");
  return html;
}

#ifdef WAYFARER_ENABLE_ZLIB
std::string Gunzip(std::string_view data) {
  ZStreamRAII zs(ZStreamRAII::Variant::gzip);
  zs.stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  zs.stream.avail_in = static_cast<uInt>(data.size());
  std::string out;
  int ret = Z_OK;
  while (ret != Z_STREAM_END) {
    char buf[4096];
    zs.stream.next_out = reinterpret_cast<Bytef*>(buf);
    zs.stream.avail_out = sizeof(buf);
    ret = inflate(&zs.stream, Z_NO_FLUSH);
    if (ret != Z_OK && ret != Z_STREAM_END) {
      ADD_FAILURE() << "inflate failed with " << ret;
      break;
    }
    out.append(buf, sizeof(buf) - zs.stream.avail_out);
  }
  return out;
}
#endif

class FilesTest : public ::testing::Test {
 protected:
  FilesTest() { runtime->withHomeDirectory(tmpDir.dirPath()); }

  HttpContext context(std::string_view target, std::string_view acceptEncoding = {}) const {
    test::RequestOptions options;
    options.target = target;
    if (!acceptEncoding.empty()) {
      options.headers.emplace_back("Accept-Encoding", acceptEncoding);
    }
    return test::MakeContext(options, runtime);
  }

  test::ParsedResponse run(const Handler& app, const HttpContext& ctx) const {
    const auto outcome = app(ctx);
    EXPECT_TRUE(outcome);
    return test::ParseResponse(test::WriteToString(*outcome));
  }

  test::ScopedTempDir tmpDir;
  std::shared_ptr<RuntimeConfig> runtime = std::make_shared<RuntimeConfig>();
};

}  // namespace

TEST_F(FilesTest, LocalFileResolvesUnderRoot) {
  test::ScopedTempFile file(tmpDir, "sub/a.txt", "a");
  const auto root = std::filesystem::weakly_canonical(tmpDir.dirPath());
  const auto resolved = [this](std::string_view name) {
    return files::LocalFile(name, tmpDir.dirPath()).value_or(std::filesystem::path("<none>")).string();
  };

  EXPECT_EQ(resolved("/sub/a.txt"), (root / "sub" / "a.txt").string());
  EXPECT_EQ(resolved("sub/../sub/a.txt"), (root / "sub" / "a.txt").string());
  EXPECT_EQ(files::ResolvePath(tmpDir.dirPath(), "/sub/a.txt").value_or("<none>").string(),
            (root / "sub" / "a.txt").string());
  // missing files still resolve, the handlers check their existence
  EXPECT_EQ(resolved("missing.txt"), (root / "missing.txt").string());
}

TEST_F(FilesTest, LocalFileRejectsEscapes) {
  EXPECT_FALSE(files::LocalFile("../../etc/passwd", tmpDir.dirPath()));
  EXPECT_FALSE(files::LocalFile("/sub/../../outside", tmpDir.dirPath()));

  const std::string sibling = tmpDir.dirPath().filename().string() + "-sibling/file";
  EXPECT_FALSE(files::LocalFile("../" + sibling, tmpDir.dirPath()));
}

TEST_F(FilesTest, SendFileWithContentTypeAndLength) {
  test::ScopedTempFile file(tmpDir, "page.html", "<p>hi</p>");
  const auto resp = run(files::SendFile(file.filePath(), false), context("/"));
  EXPECT_EQ(resp.statusCode, 200);
  EXPECT_EQ(resp.header("Content-Type"), "text/html");
  EXPECT_EQ(resp.header("Content-Length"), "9");
  EXPECT_TRUE(resp.header("Last-Modified"));
  EXPECT_FALSE(resp.chunked);
  EXPECT_EQ(resp.body, "<p>hi</p>");
}

TEST_F(FilesTest, SendFileMissingIsNoMatch) {
  EXPECT_FALSE(files::SendFile(tmpDir.dirPath() / "missing.txt", false)(context("/")));
  EXPECT_FALSE(files::SendFile(tmpDir.dirPath(), false)(context("/")));
}

TEST_F(FilesTest, UnknownExtension) {
  test::ScopedTempFile file(tmpDir, "data.unknownext", "raw");
  EXPECT_FALSE(run(files::SendFile(file.filePath(), false), context("/")).header("Content-Type"));

  runtime->withDefaultContentType("application/octet-stream");
  EXPECT_EQ(run(files::SendFile(file.filePath(), false), context("/")).header("Content-Type"),
            "application/octet-stream");

  runtime->withMimeType(".UnknownExt", MimeDescriptor{"application/x-custom", false});
  EXPECT_EQ(run(files::SendFile(file.filePath(), false), context("/")).header("Content-Type"), "application/x-custom");
}

TEST_F(FilesTest, SmallReadChunks) {
  const std::string content = "0123456789abcdefghij";
  test::ScopedTempFile file(tmpDir, "chunks.txt", content);
  runtime->withFileChunkSize(3);
  const auto resp = run(files::File("chunks.txt"), context("/"));
  EXPECT_EQ(resp.header("Content-Length"), std::to_string(content.size()));
  EXPECT_EQ(resp.body, content);
}

TEST_F(FilesTest, EmptyFile) {
  test::ScopedTempFile file(tmpDir, "empty.txt", "");
  const auto resp = run(files::File("empty.txt"), context("/"));
  EXPECT_EQ(resp.statusCode, 200);
  EXPECT_EQ(resp.header("Content-Length"), "0");
  EXPECT_TRUE(resp.body.empty());
}

TEST_F(FilesTest, NotModifiedSince) {
  test::ScopedTempFile file(tmpDir, "cached.txt", "cached content");
  const Handler app = files::File("cached.txt");

  test::RequestOptions options;
  options.headers.emplace_back("If-Modified-Since", TimeToStringRFC7231(SysClock::now() + std::chrono::hours(1)));
  const auto notModified = run(app, test::MakeContext(options, runtime));
  EXPECT_EQ(notModified.statusCode, 304);
  EXPECT_TRUE(notModified.body.empty());
  EXPECT_FALSE(notModified.header("Content-Length"));

  options.headers.front().second = "Sun, 06 Nov 1994 08:49:37 GMT";
  const auto modified = run(app, test::MakeContext(options, runtime));
  EXPECT_EQ(modified.statusCode, 200);
  EXPECT_EQ(modified.body, "cached content");

  options.headers.front().second = "not a date";
  EXPECT_EQ(run(app, test::MakeContext(options, runtime)).statusCode, 200);
}

TEST_F(FilesTest, GzipCompression) {
#ifdef WAYFARER_ENABLE_ZLIB
  const std::string html = LargeHtml();
  test::ScopedTempFile file(tmpDir, "big.html", html);
  const auto resp = run(files::File("big.html"), context("/", "gzip"));
  EXPECT_EQ(resp.statusCode, 200);
  EXPECT_EQ(resp.header("Content-Encoding"), "gzip");
  EXPECT_EQ(resp.header("Vary"), "Accept-Encoding");
  EXPECT_TRUE(resp.chunked);
  EXPECT_FALSE(resp.header("Content-Length"));
  EXPECT_LT(resp.body.size(), html.size());
  EXPECT_EQ(Gunzip(resp.body), html);
#else
  GTEST_SKIP();
#endif
}

TEST_F(FilesTest, NoCompressionWhenNotApplicable) {
  const std::string html = LargeHtml();
  test::ScopedTempFile big(tmpDir, "big.html", html);
  test::ScopedTempFile small(tmpDir, "small.html", "<p>small</p>");
  test::ScopedTempFile image(tmpDir, "big.png", html);

  EXPECT_FALSE(run(files::File("small.html"), context("/", "gzip")).header("Content-Encoding"));
  EXPECT_FALSE(run(files::File("big.png"), context("/", "gzip")).header("Content-Encoding"));
  EXPECT_FALSE(run(files::File("big.html"), context("/")).header("Content-Encoding"));
  EXPECT_FALSE(run(files::SendFile(big.filePath(), false), context("/", "gzip")).header("Content-Encoding"));

  runtime->withCompression(false);
  const auto resp = run(files::File("big.html"), context("/", "gzip"));
  EXPECT_FALSE(resp.header("Content-Encoding"));
  EXPECT_FALSE(resp.header("Vary"));
  EXPECT_EQ(resp.body, html);
}

TEST_F(FilesTest, IdentityRejectedIsNotAcceptable) {
  test::ScopedTempFile file(tmpDir, "big.html", LargeHtml());
  const auto resp = run(files::File("big.html"), context("/", "identity;q=0, unknown"));
  EXPECT_EQ(resp.statusCode, 406);
  EXPECT_TRUE(resp.body.empty());
}

TEST_F(FilesTest, BrowseServesRequestPath) {
  test::ScopedTempFile file(tmpDir, "css/site.css", "body{}");
  const Handler app = files::Browse(tmpDir.dirPath());
  const auto resp = run(app, context("/css/site.css"));
  EXPECT_EQ(resp.header("Content-Type"), "text/css");
  EXPECT_EQ(resp.body, "body{}");

  EXPECT_FALSE(app(context("/css/missing.css")));
  EXPECT_FALSE(app(context("/../outside.css")));
  EXPECT_FALSE(app(context("/%2e%2e/%2e%2e/etc/passwd")));
}

TEST_F(FilesTest, BrowseDirectoryServesIndex) {
  test::ScopedTempFile index(tmpDir, "docs/index.html", "<h1>docs</h1>");
  EXPECT_EQ(run(files::BrowseHome(), context("/docs/")).body, "<h1>docs</h1>");
  EXPECT_EQ(run(files::BrowseHome(), context("/docs")).body, "<h1>docs</h1>");

  runtime->withDefaultIndex("home.html");
  EXPECT_FALSE(files::BrowseHome()(context("/docs")));
}

TEST_F(FilesTest, BrowseFileUnderRoot) {
  test::ScopedTempFile file(tmpDir, "notes.txt", "notes");
  EXPECT_EQ(run(files::BrowseFile(tmpDir.dirPath(), "/notes.txt"), context("/anything")).body, "notes");
  EXPECT_EQ(run(files::BrowseFileHome("notes.txt"), context("/anything")).body, "notes");
  EXPECT_FALSE(files::BrowseFile(tmpDir.dirPath(), "../notes.txt")(context("/")));
}

TEST_F(FilesTest, SymlinksEscapingRootAreNotFollowed) {
  test::ScopedTempDir outsideDir;
  test::ScopedTempFile secret(outsideDir, "secret.txt", "TOP-SECRET");
  test::ScopedTempFile page(tmpDir, "sub/page.txt", "page");
  std::filesystem::create_symlink(secret.filePath(), tmpDir.dirPath() / "sub" / "index.html");
  std::filesystem::create_symlink(secret.filePath(), tmpDir.dirPath() / "leak.txt");
  std::filesystem::create_directory_symlink(outsideDir.dirPath(), tmpDir.dirPath() / "elsewhere");

  EXPECT_FALSE(files::LocalFile("leak.txt", tmpDir.dirPath()));
  EXPECT_FALSE(files::LocalFile("/elsewhere/secret.txt", tmpDir.dirPath()));
  EXPECT_FALSE(files::LocalFile("/sub/index.html", tmpDir.dirPath()));

  EXPECT_FALSE(files::BrowseHome()(context("/leak.txt")));
  EXPECT_FALSE(files::BrowseHome()(context("/sub/index.html")));
  EXPECT_FALSE(files::BrowseHome()(context("/sub")));
  EXPECT_FALSE(files::BrowseHome()(context("/sub/")));
  EXPECT_FALSE(files::BrowseHome()(context("/elsewhere/secret.txt")));
  EXPECT_FALSE(files::BrowseFile(tmpDir.dirPath(), "leak.txt")(context("/")));
  EXPECT_FALSE(files::BrowseFileHome("sub/index.html")(context("/")));

  EXPECT_FALSE(files::DirHome()(context("/elsewhere")));
  // an index pointing outside of the root does not hide the listing of its directory
  const auto listing = run(files::DirHome(), context("/sub"));
  EXPECT_EQ(listing.statusCode, 200);
  EXPECT_NE(listing.body.find("href=\"/sub/page.txt\""), std::string::npos);
  EXPECT_EQ(listing.body.find("TOP-SECRET"), std::string::npos);
}

TEST_F(FilesTest, SymlinksWithinRootAreServed) {
  test::ScopedTempFile target(tmpDir, "real/index.html", "<h1>real</h1>");
  std::filesystem::create_directory(tmpDir.dirPath() / "alias");
  std::filesystem::create_symlink(target.filePath(), tmpDir.dirPath() / "alias" / "index.html");

  EXPECT_EQ(run(files::BrowseHome(), context("/alias")).body, "<h1>real</h1>");
  EXPECT_EQ(run(files::BrowseHome(), context("/alias/index.html")).body, "<h1>real</h1>");
  EXPECT_FALSE(files::DirHome()(context("/alias")));
}

TEST_F(FilesTest, FallbackAfterMissingFile) {
  const Handler app = files::File("missing.html") | NotFound("custom not found");
  const auto resp = run(app, context("/"));
  EXPECT_EQ(resp.statusCode, 404);
  EXPECT_EQ(resp.body, "custom not found");
}

TEST_F(FilesTest, DirectoryListing) {
  test::ScopedTempFile a(tmpDir, "a.txt", "aaa");
  test::ScopedTempFile b(tmpDir, "b file.txt", "bbbb");
  test::ScopedTempFile hidden(tmpDir, ".hidden", "secret");
  test::ScopedTempFile nested(tmpDir, "sub/nested.txt", "n");

  const auto resp = run(files::Dir(tmpDir.dirPath()), context("/"));
  EXPECT_EQ(resp.statusCode, 200);
  EXPECT_EQ(resp.header("Content-Type"), "text/html; charset=utf-8");
  EXPECT_EQ(resp.header("Content-Length"), std::to_string(resp.body.size()));

  const std::string& body = resp.body;
  EXPECT_NE(body.find("<title>Index of /</title>"), std::string::npos);
  EXPECT_NE(body.find("href=\"/a.txt\""), std::string::npos);
  EXPECT_NE(body.find("href=\"/b%20file.txt\""), std::string::npos);
  EXPECT_NE(body.find("href=\"/sub/\" class=\"dir\""), std::string::npos);
  EXPECT_NE(body.find("3 B"), std::string::npos);
  EXPECT_EQ(body.find(".hidden"), std::string::npos);
  EXPECT_EQ(body.find("../"), std::string::npos);
  // directories first
  EXPECT_LT(body.find("/sub/"), body.find("/a.txt"));

  const auto subResp = run(files::DirHome(), context("/sub"));
  EXPECT_NE(subResp.body.find("href=\"/sub/nested.txt\""), std::string::npos);
  EXPECT_NE(subResp.body.find("href=\"/sub/../\""), std::string::npos);

  runtime->withShowHiddenFiles();
  EXPECT_NE(run(files::DirHome(), context("/")).body.find("href=\"/.hidden\""), std::string::npos);
}

TEST_F(FilesTest, DirectoryListingTruncated) {
  test::ScopedTempFile a(tmpDir, "a.txt", "a");
  test::ScopedTempFile b(tmpDir, "b.txt", "b");
  test::ScopedTempFile c(tmpDir, "c.txt", "c");
  runtime->withMaxEntriesToList(2);
  const auto resp = run(files::DirHome(), context("/"));
  EXPECT_NE(resp.body.find("Listing truncated after 2 entries."), std::string::npos);
}

TEST_F(FilesTest, DirectoryListingDeclines) {
  test::ScopedTempFile file(tmpDir, "file.txt", "f");
  test::ScopedTempFile index(tmpDir, "site/index.html", "index");
  const Handler app = files::DirHome();
  EXPECT_FALSE(app(context("/file.txt")));
  EXPECT_FALSE(app(context("/missing")));
  EXPECT_FALSE(app(context("/site")));
  EXPECT_FALSE(app(context("/../")));
}

TEST_F(FilesTest, CustomListingCss) {
  runtime->withDirectoryListingCss("body{color:red;}");
  const auto resp = run(files::DirHome(), context("/"));
  EXPECT_NE(resp.body.find("<style>body{color:red;}</style>"), std::string::npos);
}

}  // namespace wayfarer
