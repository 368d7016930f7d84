#include "cricket/server/routes.hpp"

#include "cricket/server/handlers.hpp"

#include <spdlog/spdlog.h>

namespace cricket::server {

auto registerApiRoutes(
    glz::http_router &Router,
    std::shared_ptr<dependencies::Dependencies> Deps
) -> std::expected<void, core::Error> {
  spdlog::debug("Registering api routes");

  Router.get("/hello", [](const glz::request &, glz::response &Response) {
    handlers::hello(Response);
  });

  Router.get(
      "/matches",
      [Deps](const glz::request &Request, glz::response &Response) {
        handlers::matches(*Deps, Request, Response);
      }
  );

  Router.get(
      "/match/:match_id",
      [Deps](const glz::request &Request, glz::response &Response) {
        handlers::matchDetail(*Deps, Request.params.at("match_id"), Response);
      },
      {.constraints = {{"match_id", dependencies::matchIdConstraint()}}}
  );

  Router.get(
      "/rankings",
      [Deps](const glz::request &Request, glz::response &Response) {
        handlers::rankings(*Deps, Request, Response);
      }
  );

  Router.get("/news", [Deps](const glz::request &, glz::response &Response) {
    handlers::news(*Deps, Response);
  });

  Router.get(
      "/trending-players",
      [](const glz::request &, glz::response &Response) {
        handlers::trendingPlayers(Response);
      }
  );

  Router.get(
      "/tweets",
      [Deps](const glz::request &Request, glz::response &Response) {
        handlers::tweets(*Deps, Request, Response);
      }
  );

  spdlog::info("Successfully registered all api routes");
  return {};
}

} // namespace cricket::server
