#include <wayfarer/combinators.hpp>
#include <wayfarer/dispatch.hpp>
#include <wayfarer/http-context.hpp>
#include <wayfarer/http-method.hpp>
#include <wayfarer/http-request.hpp>
#include <wayfarer/http-status.hpp>
#include <wayfarer/request-log.hpp>
#include <wayfarer/response-builders.hpp>
#include <wayfarer/route-matchers.hpp>
#include <wayfarer/writers.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

#include "ostream-sink.hpp"

using namespace wayfarer;

// Usage: wayfarer-example-minimal [METHOD] [TARGET]
// Routes one request and prints the response that a transport would send.
int main(int argc, char **argv) {
  std::string_view methodStr = "GET";
  std::string_view target = "/";
  if (argc > 1) {
    methodStr = argv[1];
  }
  if (argc > 2) {
    target = argv[2];
  }

  const auto method = http::MethodStrToOptEnum(methodStr);
  if (!method) {
    std::cerr << "Invalid method: " << methodStr << '\n';
    return EXIT_FAILURE;
  }

  const Handler app =
      Choose({GET >> Url("/") >> SetMimeType("text/plain") >> Ok("Hello from wayfarer!\n"),
              GET >> Url("/hello") >> Request([](const HttpRequest &req) {
                return Ok("Hello " + std::string(req.queryParam("name").value_or("stranger")) + "!\n");
              }),
              Url("/teapot") >> Respond(http::Status::OK, "I'm not a teapot\n"),
              UrlStartsWith("/legacy") >> Redirect("/")}) >>
          Log(SpdlogSink()) |
      Log(SpdlogSink()) >> NotFound("Nothing here\n");

  try {
    HttpRequest request;
    request.withMethod(*method).withTarget(target).withHeader("Host", "localhost");

    OstreamSink sink(std::cout);
    auto task = Serve(app, HttpContext(std::move(request)), sink);
    if (!task) {
      std::cerr << "No route for " << target << '\n';
      return EXIT_FAILURE;
    }
    task->runSynchronously();
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
