#include "cricket/matches/normalize.hpp"

#include "cricket/core/json.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace cricket::matches {

namespace json = core::json;

static std::string toUpper(std::string Value) {
  std::ranges::transform(Value, Value.begin(), [](unsigned char Ch) {
    return std::toupper(Ch);
  });
  return Value;
}

// Upper-cased provider status, or the requested category when the provider
// gave nothing usable.
static std::string statusOr(const glz::generic *Status, MatchType Requested) {
  if (auto Text = json::asString(Status); Text && !Text->empty()) {
    return toUpper(*Text);
  }
  return toUpper(std::string(toString(Requested)));
}

static std::vector<glz::generic> copyArray(const glz::generic *Value) {
  if (const auto *Items = json::asArray(Value)) {
    return {Items->begin(), Items->end()};
  }
  return {};
}

namespace sportmonks {

std::string_view listPath(MatchType Type) {
  switch (Type) {
  case MatchType::Live:
    return "livescores";
  case MatchType::Upcoming:
    return "fixtures";
  case MatchType::Completed:
    return "fixtures/finished";
  }
  return "livescores";
}

std::vector<glz::generic> extractList(const glz::generic &Payload) {
  return copyArray(json::member(Payload, "data"));
}

static TeamRef toTeam(const glz::generic *Team) {
  return {
      .Id = json::copyOrNull(json::member(Team, "id")),
      .Name = json::asString(json::member(Team, "name")),
      .Code = json::asString(json::member(Team, "code")),
  };
}

MatchSummary toSummary(const glz::generic &Record, MatchType Requested) {
  const auto *Venue = json::member(Record, "venue");
  return {
      .Id = json::copyOrNull(json::member(Record, "id")),
      .Status = statusOr(json::member(Record, "status"), Requested),
      .Note = json::asString(json::member(Record, "note")),
      .Runs = json::copyOrNull(json::member(Record, "runs")),
      .LeagueId = json::copyOrNull(json::member(Record, "season_id")),
      .LocalTeam = toTeam(json::member(Record, "localteam")),
      .VisitorTeam = toTeam(json::member(Record, "visitorteam")),
      .Venue =
          {
              .Name = json::asString(json::member(Venue, "name")),
              .City = json::asString(json::member(Venue, "city")),
          },
      .StartingAt = json::copyOrNull(json::member(Record, "starting_at")),
  };
}

} // namespace sportmonks

namespace cricbuzz {

std::string_view listPath(MatchType Type) {
  switch (Type) {
  case MatchType::Live:
    return "matches/v1/live";
  case MatchType::Upcoming:
    return "matches/v1/upcoming";
  case MatchType::Completed:
    return "matches/v1/recent";
  }
  return "matches/v1/live";
}

// Hosts disagree on the envelope: some wrap the list in "matches", some
// return the bare array.
std::vector<glz::generic> extractList(const glz::generic &Payload) {
  if (const auto *Wrapped = json::member(Payload, "matches")) {
    return copyArray(Wrapped);
  }
  return copyArray(&Payload);
}

static TeamRef toTeam(const glz::generic *Team) {
  return {
      .Id = glz::generic{},
      .Name = json::asString(json::member(Team, "teamName")),
      .Code = json::asString(json::member(Team, "teamSName")),
  };
}

MatchSummary toSummary(const glz::generic &Record, MatchType Requested) {
  const auto *Id = json::member(Record, "matchId");
  if (!json::truthy(Id)) {
    Id = json::member(Record, "id");
  }

  const auto *Status = json::member(Record, "matchState");
  if (!json::truthy(Status)) {
    Status = json::member(Record, "status");
  }

  const auto *Venue = json::member(Record, "venueInfo");
  return {
      .Id = json::copyOrNull(Id),
      .Status = statusOr(Status, Requested),
      .Note = json::asString(json::member(Record, "seriesName")),
      .Runs = glz::generic{},
      .LeagueId = glz::generic{},
      .LocalTeam = toTeam(json::member(Record, "team1")),
      .VisitorTeam = toTeam(json::member(Record, "team2")),
      .Venue =
          {
              .Name = json::asString(json::member(Venue, "ground")),
              .City = json::asString(json::member(Venue, "city")),
          },
      .StartingAt = json::copyOrNull(json::member(Record, "startTime")),
  };
}

} // namespace cricbuzz

} // namespace cricket::matches
