#include <algorithm>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <csignal>
#include <glaze/net/http_router.hpp>
#include <glaze/net/http_server.hpp>
#include <memory>
#include <ranges>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "cricket/core/config.hpp"
#include "cricket/core/logging.hpp"
#include "cricket/core/transport.hpp"
#include "cricket/server/dependencies.hpp"
#include "cricket/server/middleware/logging.hpp"
#include "cricket/server/routes.hpp"
#include "spdlog/spdlog.h"

int main() {
  auto IOContext = std::make_shared<asio::io_context>();

  auto Config = cricket::core::Config::load();
  if (!Config) {
    spdlog::error(Config.error().Message);
    return 1;
  }
  cricket::core::setupLogging(*Config);

  spdlog::debug(
      "Loaded config - Host: {}, Port: {}, Provider: {}", Config->Host,
      Config->Port, cricket::core::toString(Config->ActiveProvider)
  );
  auto SharedConfig =
      std::make_shared<const cricket::core::Config>(std::move(*Config));

  // Outbound HTTP client shared by every provider
  auto Transport = cricket::core::GlazeTransport::create();
  if (!Transport) {
    spdlog::error(Transport.error().Message);
    return 1;
  }

  auto Deps = cricket::server::dependencies::Dependencies::create(
      SharedConfig, Transport.value()
  );
  spdlog::info("Active match provider: {}", Deps->Matches->name());

  // Initialize HTTP Server
  auto Server{glz::http_server<false>(IOContext)};

  spdlog::info("🏏 Cricket API Proxy 🏏");
  Server.bind(SharedConfig->Host, SharedConfig->Port);
  spdlog::info(
      "Binding to Address: {}, Port: {}.", SharedConfig->Host,
      SharedConfig->Port
  );

  // Register Middleware
  Server.wrap(cricket::server::middleware::createRequestLogger());

  // Any origin, method and header, credentials allowed
  glz::cors_config Cors;
  Cors.allowed_origins = {"*"};
  Cors.allowed_methods = {"*"};
  Cors.allowed_headers = {"*"};
  Cors.allow_credentials = true;
  Server.enable_cors(Cors);

  // Register Routes
  glz::http_router Router;
  glz::http_router ApiRouter;
  spdlog::info("Registering routes:");
  if (!cricket::server::registerCoreRoutes(Router, Deps)) {
    spdlog::error("Failed registering core routes.");
    return 1;
  }
  if (!cricket::server::registerApiRoutes(ApiRouter, Deps)) {
    spdlog::error("Failed registering api routes.");
    return 1;
  }

  // Mount the routers
  Server.mount("/", Router);
  Server.mount("/api", ApiRouter);

  // 0 worker threads: the server runs on the shared IO context below
  Server.start(0);

  std::vector<std::thread> Threads;
  const size_t NumThreads = std::max(1u, std::thread::hardware_concurrency());
  Threads.reserve(NumThreads);

  spdlog::info(
      "Server ready and listening on http://{}:{}", SharedConfig->Host,
      SharedConfig->Port
  );
  spdlog::info("Sharing {} threads.", NumThreads);

  asio::signal_set Signals(*IOContext, SIGINT, SIGTERM);
  Signals.async_wait([&](const std::error_code &, int) {
    spdlog::info("Shutdown signal received.");
    Server.stop();
    IOContext->stop();
  });

  for (auto _ : std::views::iota(0uz, NumThreads)) {
    Threads.emplace_back([IOContext]() { IOContext->run(); });
  }

  for (auto &Thread : Threads) {
    if (Thread.joinable()) {
      Thread.join();
    }
  }

  spdlog::info("Server stopped.");
  return 0;
}
