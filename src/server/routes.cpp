#include "cricket/server/routes.hpp"

#include "cricket/server/middleware/response.hpp"

#include <chrono>
#include <spdlog/spdlog.h>

namespace cricket::server {

RootResponse rootStatus(const core::Config &Config) {
  return {
      .message = "Cricket Backend Running",
      .provider = std::string(core::toString(Config.ActiveProvider)),
  };
}

StatusResponse probeStatus(const core::Config &Config) {
  auto Now = std::chrono::system_clock::now();
  return {
      .backend = "✅ Running",
      .external_api = Config.hasProviderCredential() ? "✅ Configured"
                                                     : "⚠️ Not Configured",
      .provider = std::string(core::toString(Config.ActiveProvider)),
      .time = std::chrono::duration_cast<std::chrono::seconds>(
                  Now.time_since_epoch()
      )
                  .count(),
  };
}

auto registerCoreRoutes(
    glz::http_router &Router,
    std::shared_ptr<dependencies::Dependencies> Deps
) -> std::expected<void, core::Error> {
  Router.get("/", [Deps](const glz::request &, glz::response &Response) {
    middleware::writeJson(Response, rootStatus(*Deps->Config));
  });

  // Status probe; reports configuration only, no upstream is contacted.
  Router.get("/test", [Deps](const glz::request &, glz::response &Response) {
    spdlog::debug("GET /test - Status probe");
    middleware::writeJson(Response, probeStatus(*Deps->Config));
  });

  // Routes documentation endpoint
  Router.get("/routes", [](const glz::request &, glz::response &Response) {
    spdlog::debug("GET /routes - Listing all endpoints");
    Response.status(200).json(
        {{"service", "Cricket API Proxy"},
         {"version", "1.0"},
         {"endpoints",
          {{{"path", "/"},
            {"method", "GET"},
            {"description", "Service banner with the active provider"}},
           {{"path", "/test"},
            {"method", "GET"},
            {"description", "Status probe - backend and credential state"}},
           {{"path", "/routes"},
            {"method", "GET"},
            {"description", "Lists all available API endpoints"}},
           {{"path", "/api/hello"},
            {"method", "GET"},
            {"description", "Static greeting"}},
           {{"path", "/api/matches"},
            {"method", "GET"},
            {"description",
             "Normalized match list, ?type=live|upcoming|completed"}},
           {{"path", "/api/match/:match_id"},
            {"method", "GET"},
            {"description", "Provider-native match detail"}},
           {{"path", "/api/rankings"},
            {"method", "GET"},
            {"description", "ICC team and player rankings, ?format=test|odi|t20"}},
           {{"path", "/api/news"},
            {"method", "GET"},
            {"description", "Latest items from the configured RSS feeds"}},
           {{"path", "/api/trending-players"},
            {"method", "GET"},
            {"description", "Curated trending players"}},
           {{"path", "/api/tweets"},
            {"method", "GET"},
            {"description", "Recent tweets for ?query="}}}}}
    );
  });

  spdlog::info("Successfully registered core routes");
  return {};
}

} // namespace cricket::server
