#pragma once
#include "cricket/core/result.hpp"
#include "cricket/matches/models.hpp"
#include "cricket/providers/fetchers.hpp"

#include <expected>
#include <string>
#include <string_view>

namespace cricket::matches {

// TypeParam is the raw ?type= value; unknown values are a BadRequest.
auto listMatches(providers::MatchListFetcher &Fetcher, std::string_view TypeParam)
    -> std::expected<MatchList, core::Error>;

auto matchDetail(providers::MatchDetailFetcher &Fetcher, std::string_view MatchId)
    -> std::expected<std::string, core::Error>;

} // namespace cricket::matches
