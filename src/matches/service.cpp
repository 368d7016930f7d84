#include "cricket/matches/service.hpp"

#include <format>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace cricket::matches {

auto listMatches(providers::MatchListFetcher &Fetcher, std::string_view TypeParam)
    -> std::expected<MatchList, core::Error> {
  auto Type = parseMatchType(TypeParam);
  if (!Type) {
    return std::unexpected(core::Error::badRequest(std::format(
        "type must be one of live, upcoming, completed (got '{}')", TypeParam
    )));
  }

  auto Summaries = Fetcher.listMatches(*Type);
  if (!Summaries) {
    spdlog::warn(
        "Match list '{}' failed ({}): {}", TypeParam, Summaries.error().Status,
        core::truncateMessage(Summaries.error().Message)
    );
    return std::unexpected(Summaries.error());
  }

  return MatchList{
      .Type = std::string(toString(*Type)),
      .Matches = std::move(*Summaries),
  };
}

auto matchDetail(providers::MatchDetailFetcher &Fetcher, std::string_view MatchId)
    -> std::expected<std::string, core::Error> {
  if (MatchId.empty()) {
    return std::unexpected(core::Error::badRequest("match_id is required"));
  }

  auto Detail = Fetcher.matchDetail(MatchId);
  if (!Detail) {
    spdlog::warn(
        "Match detail '{}' failed ({}): {}", MatchId, Detail.error().Status,
        core::truncateMessage(Detail.error().Message)
    );
  }
  return Detail;
}

} // namespace cricket::matches
