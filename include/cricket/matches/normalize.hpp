#pragma once
#include "cricket/matches/models.hpp"

#include <glaze/json/generic.hpp>

#include <string_view>
#include <vector>

// One mapping per (provider, resource). All of them accept any JSON value and
// substitute null for whatever is missing; none of them fail.
namespace cricket::matches {

namespace sportmonks {

inline constexpr std::string_view ListIncludes =
    "localteam,visitorteam,venue,season";
inline constexpr std::string_view DetailIncludes =
    "localteam,visitorteam,venue,runs,batting,bowling,manofmatch,manofseries,"
    "lineup,balls,scoreboards";

std::string_view listPath(MatchType Type);
std::vector<glz::generic> extractList(const glz::generic &Payload);
MatchSummary toSummary(const glz::generic &Record, MatchType Requested);

} // namespace sportmonks

namespace cricbuzz {

std::string_view listPath(MatchType Type);
std::vector<glz::generic> extractList(const glz::generic &Payload);
MatchSummary toSummary(const glz::generic &Record, MatchType Requested);

} // namespace cricbuzz

} // namespace cricket::matches
