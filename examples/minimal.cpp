#include <decoy/decoy.hpp>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace decoy;

int main() {
  try {
    MockServer server(MockServerConfig{}.withNbThreads(2).withNoMatchBody("no expectation for this request"));

    server.expectations([](ExpectationSet& set) {
      set.expect()
          .method(http::Method::GET)
          .path("/health")
          .times(CallCount::AtLeast(1))
          .respond(Responder().body("up"));
      set.expect()
          .method(http::Method::POST)
          .path("/orders")
          .header("Content-Type", ValueMatcher::EqualsIgnoreCase("application/json"))
          .times(CallCount::Exactly(1))
          .respond(Responder(http::StatusCodeCreated).header("Location", "/orders/42"));
    });

    server.start();

    // The default listener serves requests in-process, without sockets.
    auto& listener = static_cast<InProcessListener&>(server.listener());
    const auto health = listener.send("GET", "/health");
    std::cout << "GET /health -> " << health.status << " " << health.body << '\n';

    const auto created =
        listener.send("POST", "/orders", NamedValues{{"Content-Type", "application/json"}}, R"({"item":"book"})");
    std::cout << "POST /orders -> " << created.status << " " << created.headerValueOrEmpty("Location") << '\n';

    const auto missing = listener.send("DELETE", "/orders/42");
    std::cout << "DELETE /orders/42 -> " << missing.status << " " << missing.body << '\n';
    if (const auto mismatch = server.lastMismatchReport()) {
      std::cout << mismatch->summary() << '\n';
    }

    const bool verified = server.verify(std::chrono::milliseconds(100));
    std::cout << server.verificationReport().summary() << '\n';
    server.stop();
    return verified ? EXIT_SUCCESS : EXIT_FAILURE;
  } catch (const std::exception& e) {
    std::cerr << "Mock server encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }
}
