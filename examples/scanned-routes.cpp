#include <wayfarer/authentication.hpp>
#include <wayfarer/base64.hpp>
#include <wayfarer/combinators.hpp>
#include <wayfarer/dispatch.hpp>
#include <wayfarer/http-context.hpp>
#include <wayfarer/http-request.hpp>
#include <wayfarer/response-builders.hpp>
#include <wayfarer/route-matchers.hpp>
#include <wayfarer/url-scan.hpp>
#include <wayfarer/writers.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

#include "ostream-sink.hpp"

using namespace wayfarer;

namespace {

// Typed routes of a small inventory API, the admin part being protected by basic authentication.
Handler MakeInventoryApp() {
  const Handler items = Choose({
      UrlScan<unsigned>("/items/%u", [](unsigned id) { return Ok("item #" + std::to_string(id) + "\n"); }),
      UrlScan<std::string, double>("/items/%s/price/%f",
                                   [](const std::string &name, double price) {
                                     return Ok(name + " costs " + std::to_string(price) + "\n");
                                   }),
      UrlScanCi<bool>("/items/available/%b",
                      [](bool available) { return Ok(available ? "in stock\n" : "sold out\n"); }),
  });
  const Handler admin = AuthenticateBasic(
      [](const BasicCredentials &credentials) { return credentials.user == "admin" && credentials.password == "admin"; },
      Context([](const HttpContext &ctx) {
        return Ok("Hello " + std::string(ctx.userData(kUserNameKey).value_or("")) + "\n");
      }));

  return GET >> items | UrlStartsWith("/admin") >> admin | NotFound("Unknown route\n");
}

}  // namespace

// Usage: wayfarer-example-scanned-routes TARGET [USER:PASSWORD]
int main(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " TARGET [USER:PASSWORD]\n";
    return EXIT_FAILURE;
  }

  try {
    const Handler app = MakeInventoryApp();

    HttpRequest request;
    request.withTarget(argv[1]).withHeader("Host", "localhost");
    if (argc > 2) {
      request.withHeader("Authorization", "Basic " + B64Encode(argv[2]));
    }

    OstreamSink sink(std::cout);
    auto task = Serve(app, HttpContext(std::move(request)), sink);
    if (task) {
      task->runSynchronously();
    }
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
