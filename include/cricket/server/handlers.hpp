#pragma once
#include "cricket/server/dependencies.hpp"

#include "glaze/net/http_server.hpp"

#include <string_view>

// Bodies of the /api routes. Each one writes a complete response, errors
// included, and never throws.
namespace cricket::server::handlers {

void hello(glz::response &Response);

// ?type= defaults to live.
void matches(
    const dependencies::Dependencies &Deps, const glz::request &Request,
    glz::response &Response
);

void matchDetail(
    const dependencies::Dependencies &Deps, std::string_view MatchId,
    glz::response &Response
);

// ?format= defaults to odi.
void rankings(
    const dependencies::Dependencies &Deps, const glz::request &Request,
    glz::response &Response
);

void news(const dependencies::Dependencies &Deps, glz::response &Response);

void trendingPlayers(glz::response &Response);

void tweets(
    const dependencies::Dependencies &Deps, const glz::request &Request,
    glz::response &Response
);

} // namespace cricket::server::handlers
