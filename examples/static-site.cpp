#include <wayfarer/combinators.hpp>
#include <wayfarer/dispatch.hpp>
#include <wayfarer/files.hpp>
#include <wayfarer/http-context.hpp>
#include <wayfarer/http-request.hpp>
#include <wayfarer/log.hpp>
#include <wayfarer/request-log.hpp>
#include <wayfarer/response-builders.hpp>
#include <wayfarer/route-matchers.hpp>
#include <wayfarer/runtime-config.hpp>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string_view>
#include <utility>

#include "ostream-sink.hpp"

// Usage: wayfarer-example-static-site [ROOT] [TARGET] [ACCEPT-ENCODING]
// Serves TARGET from ROOT like a static web server would: files, index files and directory listings.
int main(int argc, char **argv) {
  std::filesystem::path root = ".";
  std::string_view target = "/";
  std::string_view acceptEncoding;
  if (argc > 1) {
    root = argv[1];
  }
  if (argc > 2) {
    target = argv[2];
  }
  if (argc > 3) {
    acceptEncoding = argv[3];
  }

  try {
    auto runtime = std::make_shared<wayfarer::RuntimeConfig>();
    runtime->withHomeDirectory(root).withShowHiddenFiles(false).withLogLevel(wayfarer::log::level::debug);
    runtime->validate();
    wayfarer::ApplyLogLevel(*runtime);

    using namespace wayfarer;
    const Handler app = (GET | HEAD) >> (files::BrowseHome() | files::DirHome()) >> Log(SpdlogSink()) |
                        NotFound("Not found\n") >> Log(SpdlogSink());

    HttpRequest request;
    request.withTarget(target).withHeader("Host", "localhost");
    if (!acceptEncoding.empty()) {
      request.withHeader("Accept-Encoding", acceptEncoding);
    }

    std::cout << "Serving " << target << " from " << root << "\n\n";
    OstreamSink sink(std::cout);
    auto task = Serve(app, HttpContext(std::move(request), std::move(runtime)), sink);
    if (task) {
      task->runSynchronously();
    }
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
