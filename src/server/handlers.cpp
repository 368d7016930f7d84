#include "cricket/server/handlers.hpp"

#include "cricket/core/url.hpp"
#include "cricket/matches/service.hpp"
#include "cricket/news/service.hpp"
#include "cricket/rankings/service.hpp"
#include "cricket/server/middleware/response.hpp"
#include "cricket/server/routes.hpp"
#include "cricket/social/service.hpp"

#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace cricket::server::handlers {

using middleware::guarded;
using middleware::writeError;
using middleware::writeJson;

// Value of ?Key=, Default only when the key is absent altogether.
static std::string queryOr(
    const glz::request &Request, const std::string &Key, std::string Default
) {
  auto Query = core::parseQuery(Request.target);
  auto It = Query.find(Key);
  return It == Query.end() ? std::move(Default) : It->second;
}

void hello(glz::response &Response) {
  writeJson(Response, HelloResponse{"Hello from the backend API!"});
}

void matches(
    const dependencies::Dependencies &Deps, const glz::request &Request,
    glz::response &Response
) {
  guarded(Response, "GET /api/matches", [&] {
    auto Type = queryOr(Request, "type", "live");
    spdlog::debug(
        "GET /api/matches - type '{}' via {}", Type, Deps.Matches->name()
    );
    auto Result = cricket::matches::listMatches(*Deps.Matches, Type);
    if (!Result) {
      writeError(Response, Result.error());
      return;
    }
    writeJson(Response, *Result);
  });
}

void matchDetail(
    const dependencies::Dependencies &Deps, std::string_view MatchId,
    glz::response &Response
) {
  guarded(Response, "GET /api/match/:match_id", [&] {
    spdlog::debug("GET /api/match/{} - Fetching detail", MatchId);
    auto Result = cricket::matches::matchDetail(*Deps.Matches, MatchId);
    if (!Result) {
      writeError(Response, Result.error());
      return;
    }
    // Already JSON; forwarded without re-encoding.
    middleware::writeBody(
        Response, static_cast<int>(core::HttpStatus::Ok), std::move(*Result)
    );
  });
}

void rankings(
    const dependencies::Dependencies &Deps, const glz::request &Request,
    glz::response &Response
) {
  guarded(Response, "GET /api/rankings", [&] {
    auto Format = queryOr(Request, "format", "odi");
    auto Result = cricket::rankings::fetchRankings(*Deps.Rankings, Format);
    if (!Result) {
      writeError(Response, Result.error());
      return;
    }
    writeJson(Response, *Result);
  });
}

void news(const dependencies::Dependencies &Deps, glz::response &Response) {
  guarded(Response, "GET /api/news", [&] {
    auto Result = cricket::news::fetchNews(*Deps.Transport, Deps.Config->NewsFeeds);
    spdlog::debug("GET /api/news - {} items", Result.Items.size());
    writeJson(Response, Result);
  });
}

void trendingPlayers(glz::response &Response) {
  writeJson(Response, social::trendingPlayers());
}

void tweets(
    const dependencies::Dependencies &Deps, const glz::request &Request,
    glz::response &Response
) {
  guarded(Response, "GET /api/tweets", [&] {
    auto Query = queryOr(Request, "query", "");
    auto Result = social::searchTweets(*Deps.Twitter, Query);
    if (!Result) {
      writeError(Response, Result.error());
      return;
    }
    if (Result->Note) {
      writeJson(Response, *Result);
      return;
    }
    writeJson(Response, social::TweetList{std::move(Result->Tweets)});
  });
}

} // namespace cricket::server::handlers
